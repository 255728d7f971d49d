// src/utils/hashing.cpp
#include "alm/utils/hashing.hpp"
#include <openssl/evp.h>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace alm {

namespace {

using Digest = std::vector<unsigned char>;

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

class Hasher {
public:
    explicit Hasher(const EVP_MD* md) : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), md, nullptr) != 1) {
            throw std::runtime_error("Failed to initialize digest context");
        }
    }

    void update(const void* data, size_t length) {
        if (length == 0) return;
        if (EVP_DigestUpdate(ctx_.get(), data, length) != 1) {
            throw std::runtime_error("Digest update failed");
        }
    }

    Digest finish() {
        Digest digest(EVP_MAX_MD_SIZE);
        unsigned int length = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &length) != 1) {
            throw std::runtime_error("Digest finalization failed");
        }
        digest.resize(length);
        return digest;
    }

private:
    DigestContext ctx_;
};

Digest digest_of(const EVP_MD* md, const std::string& text) {
    Hasher hasher(md);
    hasher.update(text.data(), text.size());
    return hasher.finish();
}

std::string to_hex(const Digest& digest) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char byte : digest) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

} // anonymous namespace

uint64_t get_seed_from_string(const std::string& seed_str, size_t n_bytes) {
    if (n_bytes == 0 || n_bytes > sizeof(uint64_t)) {
        throw std::invalid_argument("n_bytes must be in [1, 8], got " + std::to_string(n_bytes));
    }

    Digest digest = digest_of(EVP_sha1(), seed_str);
    uint64_t seed = 0;
    for (size_t i = 0; i < n_bytes; ++i) {
        seed = (seed << 8) | digest[i];
    }
    return seed;
}

int hash_trick(const std::string& word, int vocab_size) {
    if (vocab_size <= 0) {
        throw std::invalid_argument("vocab_size must be positive");
    }

    // Horner's rule on the 256-bit digest; the remainder stays below 2^31,
    // so remainder * 256 + byte fits comfortably in 64 bits.
    Digest digest = digest_of(EVP_sha256(), word);
    uint64_t remainder = 0;
    for (unsigned char byte : digest) {
        remainder = (remainder * 256 + byte) % static_cast<uint64_t>(vocab_size);
    }
    return static_cast<int>(remainder);
}

std::string model_hash(const std::vector<Tensor>& parameters) {
    Hasher hasher(EVP_sha1());
    for (const auto& param : parameters) {
        hasher.update(param.data().data(), param.size() * sizeof(float));
    }
    return to_hex(hasher.finish());
}

std::string model_hash(const std::map<std::string, Tensor>& state) {
    Hasher hasher(EVP_sha1());
    for (const auto& [name, param] : state) {
        hasher.update(param.data().data(), param.size() * sizeof(float));
    }
    return to_hex(hasher.finish());
}

} // namespace alm
