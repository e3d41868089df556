#pragma once

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

namespace cloudpan::client
{

    enum class ProgressUnit : std::uint8_t
    {
        Bytes,
        Files
    };

    // Terminal progress indicator seen by the transfer engine.
    class ProgressSink
    {
    public:
        virtual ~ProgressSink() = default;

        virtual void start(const std::string &label, std::uint64_t total) = 0;
        virtual void advance(std::uint64_t amount, const std::string &note = {}) = 0;
        virtual void finish() = 0;
    };

    class NullProgress final : public ProgressSink
    {
    public:
        void start(const std::string &, std::uint64_t) override {}
        void advance(std::uint64_t, const std::string &) override {}
        void finish() override {}
    };

    // Carriage-return status line, stderr unless told otherwise. stdout is
    // reserved for the command's JSON result.
    class ConsoleProgress final : public ProgressSink
    {
    public:
        explicit ConsoleProgress(ProgressUnit unit);
        ConsoleProgress(ProgressUnit unit, std::ostream &out);

        void start(const std::string &label, std::uint64_t total) override;
        void advance(std::uint64_t amount, const std::string &note = {}) override;
        void finish() override;

    private:
        void render(const std::string &note);

        ProgressUnit unit_;
        std::ostream &out_;
        std::mutex mutex_;
        std::string label_;
        std::uint64_t total_{};
        std::uint64_t done_{};
        bool active_{};
    };

    std::unique_ptr<ProgressSink> make_progress(bool enabled, ProgressUnit unit);

} // namespace cloudpan::client
