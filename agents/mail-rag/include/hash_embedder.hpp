#pragma once
#include <cstddef>
#include "providers.hpp"

// Deterministic, NOT semantic: SHA-256 in counter mode spread over
// `dimension` floats in [-1, 1], then unit-normalized. Identical text gives
// identical vectors across runs, so rankings are reproducible offline, but
// nearness says nothing about meaning.
class HashEmbedder : public Embedder {
public:
    explicit HashEmbedder(std::size_t dimension);
    std::vector<float> embed(const std::string& text) override;

private:
    std::size_t dim_;
};
