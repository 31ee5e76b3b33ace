#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

// Helper function to create a vector of bytes from a string
inline std::vector<std::byte> string_to_byte_vector(const std::string &str) {
    std::vector<std::byte> vec(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        vec[i] = static_cast<std::byte>(str[i]);
    }
    return vec;
}

inline std::string byte_vector_to_string(const std::vector<std::byte> &vec) {
    return std::string(reinterpret_cast<const char *>(vec.data()), vec.size());
}

// Deterministic pseudo-random bytes; identical seeds give identical output.
inline std::vector<std::byte> random_bytes(size_t size, uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<std::byte> vec(size);
    for (auto &b : vec) {
        b = static_cast<std::byte>(dist(gen));
    }
    return vec;
}

// Text-like bytes: words drawn from a small vocabulary, so the data
// compresses and near-copies stay similar.
inline std::vector<std::byte> text_bytes(size_t size, uint32_t seed) {
    static const char *words[] = {"agent", "tool",   "call",  "result",
                                  "file",  "read",   "write", "build",
                                  "test",  "status", "ok",    "error"};
    std::mt19937 gen(seed);
    std::uniform_int_distribution<size_t> dist(0, 11);
    std::string text;
    text.reserve(size + 16);
    while (text.size() < size) {
        text += words[dist(gen)];
        text += (text.size() % 9 == 0) ? '\n' : ' ';
    }
    text.resize(size);
    return string_to_byte_vector(text);
}

// Copy of @p base with [offset, offset + length) replaced by unrelated text
// drawn from the same vocabulary, so the result stays similar to @p base.
inline std::vector<std::byte> with_edit(const std::vector<std::byte> &base,
                                        size_t offset, size_t length,
                                        uint32_t seed) {
    auto out = base;
    auto replacement = text_bytes(length, seed);
    for (size_t i = 0; i < length && offset + i < out.size(); ++i) {
        out[offset + i] = replacement[i];
    }
    return out;
}
