#include <charconv>
#include <cstdlib>
#include <optional>
#include <pathfork/config/config.h>
#include <string>
#include <string_view>

namespace pathfork::config
{
namespace
{

std::optional<unsigned> parse_unsigned(std::string_view input)
{
    unsigned value = 0;
    const auto* begin = input.data();
    const auto* end = input.data() + input.size();
    const auto result = std::from_chars(begin, end, value);
    if (input.empty() || result.ec != std::errc{} || result.ptr != end)
    {
        return std::nullopt;
    }
    return value;
}

} // namespace

ConfigResult config_from_env()
{
    BrancherConfig cfg;

    if (const char* timeout = std::getenv("PATHFORK_CHECK_TIMEOUT"); timeout != nullptr)
    {
        const auto parsed = parse_unsigned(timeout);
        if (!parsed.has_value() || *parsed == 0)
        {
            auto d = pathfork::diag::error("invalid PATHFORK_CHECK_TIMEOUT value '" +
                                           std::string(timeout) + "'");
            d.notes.push_back({"expected a positive number of milliseconds"});
            return d;
        }
        cfg.check_timeout_ms = *parsed;
    }

    cfg.trace = std::getenv("PATHFORK_TRACE") != nullptr;
    return cfg;
}

} // namespace pathfork::config
