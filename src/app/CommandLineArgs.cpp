#include "app/CommandLineArgs.h"

#include <cctype>
#include <charconv>
#include <cmath>
#include <sstream>
#include <string_view>
#include <system_error>

namespace civ::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

// Splits "--opt=value" into its name and value; plain "--opt" has no value.
[[nodiscard]] std::string_view SplitValue(std::string_view arg, std::optional<std::string_view>& outValue)
{
    const std::size_t eq = arg.find('=');
    if (eq == std::string_view::npos)
    {
        outValue.reset();
        return arg;
    }
    outValue = arg.substr(eq + 1);
    return arg.substr(0, eq);
}

[[nodiscard]] std::optional<double> ParsePositiveDouble(std::string_view s)
{
    if (s.empty())
        return std::nullopt;

    double v = 0.0;
    const char* begin = s.data();
    const char* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end || !std::isfinite(v) || v <= 0.0)
        return std::nullopt;
    return v;
}

} // namespace

CommandLineArgs ParseCommandLineArgs(int argc, const char* const* argv)
{
    CommandLineArgs out;
    if (argc <= 1 || !argv)
        return out;

    for (int i = 1; i < argc; ++i)
    {
        if (!argv[i])
            continue;
        const std::string_view raw(argv[i]);
        if (raw.empty())
            continue;

        std::optional<std::string_view> inlineValue;
        const std::string name = ToLower(SplitValue(raw, inlineValue));

        if (name == "--help" || name == "-h" || name == "-?")
        {
            out.showHelp = true;
            continue;
        }

        if (!StartsWith(name, "--"))
        {
            out.unknown.emplace_back(raw);
            continue;
        }

        // Options with values: inline after '=' or the next argument. A next
        // argument that is itself an option, or a bad number, is not consumed.
        const auto peekValue = [&]() -> std::optional<std::string_view> {
            if (inlineValue)
                return inlineValue->empty() ? std::nullopt : inlineValue;
            if (i + 1 >= argc || !argv[i + 1])
                return std::nullopt;
            const std::string_view next(argv[i + 1]);
            if (next.empty() || StartsWith(next, "-"))
                return std::nullopt;
            return next;
        };
        const auto consume = [&]() {
            if (!inlineValue)
                ++i;
        };

        if (name == "--config" || name == "--load")
        {
            const auto value = peekValue();
            if (!value)
            {
                out.unknown.emplace_back(raw);
                continue;
            }
            consume();
            (name == "--config" ? out.configDir : out.loadName) = std::string(*value);
        }
        else if (name == "--tick-seconds")
        {
            const auto value = peekValue();
            const auto parsed = value ? ParsePositiveDouble(*value) : std::nullopt;
            if (!parsed)
            {
                out.unknown.emplace_back(raw);
                continue;
            }
            consume();
            out.tickSeconds = *parsed;
        }
        else
        {
            out.unknown.emplace_back(raw);
        }
    }

    return out;
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "Usage: cividle [options]\n"
        << "\n"
        << "Options:\n"
        << "  --help, -h              Show this help and exit\n"
        << "  --config <dir>          Directory holding config.ini (default: .)\n"
        << "  --tick-seconds <s>      Seconds per simulation tick (overrides config)\n"
        << "  --load <save>           Load the named save instead of starting fresh\n"
        << "\n"
        << "Both --option=value and --option value forms are accepted.\n"
        << "Type 'help' in game for the list of commands.\n";
    return oss.str();
}

} // namespace civ::app
