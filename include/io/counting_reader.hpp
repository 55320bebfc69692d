#pragma once
#include "io/io.hpp"
#include "util/progress.hpp"

#include <cstdint>
#include <memory>
#include <string_view>

namespace piprov {

// Counts bytes pulled through `inner` and reports them to an optional progress sink.
class CountingReader final : public IReader {
public:
    explicit CountingReader(std::unique_ptr<IReader> inner,
                            IProgress* progress = nullptr,
                            std::string_view stage = {})
        : inner_(std::move(inner)), progress_(progress), stage_(stage) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        const ssize_t n = inner_->Read(out);
        if (n > 0) {
            read_ += static_cast<std::uint64_t>(n);
            if (progress_) {
                progress_->OnProgress(
                    {.stage = stage_, .done = read_, .total = inner_->TotalSize().value_or(0)});
            }
        }
        return n;
    }

    std::uint64_t BytesRead() const { return read_; }

    std::optional<std::uint64_t> TotalSize() const override {
        return inner_ ? inner_->TotalSize() : std::nullopt;
    }

private:
    std::unique_ptr<IReader> inner_;
    IProgress* progress_ = nullptr;
    std::string_view stage_;
    std::uint64_t read_ = 0;
};

} // namespace piprov
