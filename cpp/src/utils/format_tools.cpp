#include "cgt_platform.hpp"
#include "utils/format_tools.hpp"

#include <fstream>
#include <sstream>

#include <fmt/chrono.h>

namespace cellgate::format_tools
{

// Formatted local time with sub-second resolution: format the whole seconds with fmt's
// chrono support, then append the microsecond part.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    int fractional_us = static_cast<int>((tp_us - secs).count());
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", secs);
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string formatted_duration(std::chrono::milliseconds duration)
{
    const auto ms = duration.count();
    if (ms < 1000)
    {
        return fmt::format("{}ms", ms);
    }
    if (ms < 60 * 1000)
    {
        return fmt::format("{:.1f}s", static_cast<double>(ms) / 1000.0);
    }
    const auto total_s = ms / 1000;
    return fmt::format("{}m{:02d}s", total_s / 60, total_s % 60);
}

std::string tail_bytes(std::string_view text, std::size_t max_bytes)
{
    if (text.size() <= max_bytes)
    {
        return std::string(text);
    }
    std::string_view kept = text.substr(text.size() - max_bytes);
    const auto nl = kept.find('\n');
    if (nl != std::string_view::npos && nl + 1 < kept.size())
    {
        kept.remove_prefix(nl + 1);
    }
    else
    {
        // Never start in the middle of a UTF-8 sequence.
        while (!kept.empty() && (static_cast<unsigned char>(kept.front()) & 0xC0) == 0x80)
        {
            kept.remove_prefix(1);
        }
    }
    std::string out = "...\n";
    out.append(kept);
    return out;
}

std::vector<std::string> split_lines(std::string_view text)
{
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size())
    {
        auto end = text.find('\n', start);
        if (end == std::string_view::npos)
        {
            end = text.size();
        }
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
        {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);
        start = end + 1;
    }
    return lines;
}

std::string strip_ansi(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size())
    {
        if (text[i] != '\x1b')
        {
            out.push_back(text[i++]);
            continue;
        }
        ++i;
        if (i < text.size() && text[i] == '[')
        {
            // CSI: parameter and intermediate bytes, then one final byte in 0x40..0x7E.
            ++i;
            while (i < text.size() && (text[i] < 0x40 || text[i] > 0x7E) && text[i] >= 0x20)
            {
                ++i;
            }
            if (i < text.size())
            {
                ++i;
            }
        }
        else if (i < text.size())
        {
            ++i;
        }
    }
    return out;
}

std::optional<std::string> read_file(const std::filesystem::path &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
    {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string join_command_line(const std::vector<std::string> &argv)
{
    std::string out;
    for (const auto &arg : argv)
    {
        if (!out.empty())
        {
            out += ' ';
        }
        if (arg.empty() || arg.find_first_of(" \t\"") != std::string::npos)
        {
            out += '"';
            for (char c : arg)
            {
                if (c == '"')
                {
                    out += '\\';
                }
                out += c;
            }
            out += '"';
        }
        else
        {
            out += arg;
        }
    }
    return out;
}

#if defined(CELLGATE_PLATFORM_WIN64)

std::wstring s2ws(const std::string &s)
{
    if (s.empty())
        return {};

    int required =
        MultiByteToWideChar(CP_UTF8, // UTF-8 input
                            MB_ERR_INVALID_CHARS, s.data(), static_cast<int>(s.size()), nullptr, 0);

    if (required <= 0)
        return {};

    std::wstring w(required, L'\0');

    int written = MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, s.data(),
                                      static_cast<int>(s.size()), w.data(), required);

    if (written == 0)
        return {};

    return w;
}

std::string ws2s(const std::wstring &w)
{
    if (w.empty())
        return {};

    int required = WideCharToMultiByte(CP_UTF8, // UTF-8 output
                                       WC_ERR_INVALID_CHARS, w.data(), static_cast<int>(w.size()),
                                       nullptr, 0, nullptr, nullptr);

    if (required <= 0)
        return {};

    std::string s(required, '\0');

    int written =
        WideCharToMultiByte(CP_UTF8, WC_ERR_INVALID_CHARS, w.data(), static_cast<int>(w.size()),
                            s.data(), required, nullptr, nullptr);

    if (written == 0)
        return {};

    return s;
}

#else

std::wstring s2ws([[maybe_unused]] const std::string &str)
{
    return {};
}

std::string ws2s([[maybe_unused]] const std::wstring &wstr)
{
    return {};
}

#endif

} // namespace cellgate::format_tools
