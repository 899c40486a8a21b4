#pragma once

#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

#include "scplink/options.hpp"

namespace scplink::client
{

    // Prints "\r<name> <done> / <total> bytes (<percent>%)" lines to a terminal stream.
    class ConsoleProgress : public ProgressObserver
    {
    public:
        explicit ConsoleProgress(std::ostream &out);

        void begin(const std::string &name, std::uint64_t total_bytes) override;
        void advance(std::uint64_t bytes) override;
        void finish() override;

    private:
        void render();

        std::ostream &out_;
        std::mutex mutex_;
        std::string name_;
        std::uint64_t total_{0};
        std::uint64_t done_{0};
        int last_percent_{-1};
    };

} // namespace scplink::client
