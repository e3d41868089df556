#include "cloudpan/client/progress.hpp"

#include <cstdio>
#include <iostream>
#include <iterator>

namespace cloudpan::client
{

    namespace
    {

        std::string format_bytes(std::uint64_t bytes)
        {
            static constexpr const char *kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
            double value = static_cast<double>(bytes);
            std::size_t unit = 0;
            while (value >= 1024.0 && unit + 1 < std::size(kUnits))
            {
                value /= 1024.0;
                ++unit;
            }
            char buffer[32];
            std::snprintf(buffer, sizeof(buffer), unit == 0 ? "%.0f %s" : "%.1f %s", value, kUnits[unit]);
            return buffer;
        }

    } // namespace

    ConsoleProgress::ConsoleProgress(ProgressUnit unit) : ConsoleProgress(unit, std::cerr) {}

    ConsoleProgress::ConsoleProgress(ProgressUnit unit, std::ostream &out) : unit_(unit), out_(out) {}

    void ConsoleProgress::start(const std::string &label, std::uint64_t total)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        label_ = label;
        total_ = total;
        done_ = 0;
        active_ = true;
        render({});
    }

    void ConsoleProgress::advance(std::uint64_t amount, const std::string &note)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_)
        {
            return;
        }
        done_ += amount;
        render(note);
    }

    void ConsoleProgress::finish()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_)
        {
            return;
        }
        active_ = false;
        out_ << std::endl;
    }

    void ConsoleProgress::render(const std::string &note)
    {
        out_ << '\r' << label_ << ": ";
        if (unit_ == ProgressUnit::Bytes)
        {
            out_ << format_bytes(done_) << " / " << format_bytes(total_);
        }
        else
        {
            out_ << done_ << " / " << total_ << " files";
        }
        if (!note.empty())
        {
            out_ << "  " << note;
        }
        out_ << "\x1b[K" << std::flush;
    }

    std::unique_ptr<ProgressSink> make_progress(bool enabled, ProgressUnit unit)
    {
        if (!enabled)
        {
            return std::make_unique<NullProgress>();
        }
        return std::make_unique<ConsoleProgress>(unit);
    }

} // namespace cloudpan::client
