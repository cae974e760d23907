#include "../include/hash_embedder.hpp"
#include "../include/util.hpp"
#include <openssl/sha.h>
#include <cstdint>
#include <stdexcept>

HashEmbedder::HashEmbedder(std::size_t dimension) : dim_(dimension) {
    if (dim_ == 0) throw std::invalid_argument("HashEmbedder: dimension must be > 0");
}

std::vector<float> HashEmbedder::embed(const std::string& text) {
    std::vector<float> vec;
    vec.reserve(dim_);
    std::string block_input = text;
    block_input.append(4, '\0');
    unsigned char md[SHA256_DIGEST_LENGTH];
    for (std::uint32_t counter = 0; vec.size() < dim_; ++counter) {
        for (int i = 0; i < 4; ++i) block_input[text.size() + i] = (char)((counter >> (8 * i)) & 0xFF);
        SHA256(reinterpret_cast<const unsigned char*>(block_input.data()), block_input.size(), md);
        for (int i = 0; i < SHA256_DIGEST_LENGTH && vec.size() < dim_; ++i) {
            vec.push_back((float)md[i] / 127.5f - 1.0f);
        }
    }
    l2_normalize(vec);
    return vec;
}
