#include "scplink/crypto.hpp"

#include <array>
#include <mutex>
#include <stdexcept>

#include <sodium.h>

namespace scplink::crypto
{

    namespace
    {

        using Digest = std::array<unsigned char, crypto_generichash_BYTES>;

        void init_sodium()
        {
            static std::once_flag flag;
            std::call_once(flag, []()
                           {
                               if (sodium_init() < 0)
                               {
                                   throw std::runtime_error("libsodium initialization failed");
                               }
                           });
        }

        std::string hex_digest(const Digest &digest)
        {
            std::string hex(digest.size() * 2 + 1, '\0');
            sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
            hex.pop_back();
            return hex;
        }

    } // namespace

    struct ContentHasher::State
    {
        crypto_generichash_state sodium{};
    };

    ContentHasher::ContentHasher() : state_(std::make_unique<State>())
    {
        init_sodium();
        if (crypto_generichash_init(&state_->sodium, nullptr, 0, crypto_generichash_BYTES) != 0)
        {
            throw std::runtime_error("crypto_generichash_init failed");
        }
    }

    ContentHasher::~ContentHasher() = default;

    void ContentHasher::update(std::span<const std::byte> data)
    {
        if (finished_)
        {
            throw std::logic_error("ContentHasher updated after finish()");
        }
        if (crypto_generichash_update(&state_->sodium, reinterpret_cast<const unsigned char *>(data.data()),
                                      data.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_update failed");
        }
    }

    std::string ContentHasher::finish()
    {
        if (finished_)
        {
            throw std::logic_error("ContentHasher finished twice");
        }
        finished_ = true;
        Digest digest{};
        if (crypto_generichash_final(&state_->sodium, digest.data(), digest.size()) != 0)
        {
            throw std::runtime_error("crypto_generichash_final failed");
        }
        return hex_digest(digest);
    }

} // namespace scplink::crypto
