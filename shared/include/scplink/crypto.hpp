/**
 * scplink - Content digests built on libsodium (BLAKE2b via crypto_generichash).
 */
#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>

namespace scplink::crypto
{

    // Digest of data fed in pieces while a file body crosses the wire.
    class ContentHasher
    {
    public:
        ContentHasher();
        ~ContentHasher();

        ContentHasher(const ContentHasher &) = delete;
        ContentHasher &operator=(const ContentHasher &) = delete;

        void update(std::span<const std::byte> data);

        // Lowercase hex digest. The hasher cannot be updated afterwards.
        std::string finish();

    private:
        struct State;
        std::unique_ptr<State> state_;
        bool finished_{false};
    };

} // namespace scplink::crypto
