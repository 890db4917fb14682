#include "core/json_util.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

namespace cutline::json
{

namespace
{

// Position just past the ':' that follows "key", or npos.
size_t value_start(const std::string& json, std::string_view key)
{
    std::string search = "\"" + std::string(key) + "\"";
    auto        pos    = json.find(search);
    if (pos == std::string::npos)
        return std::string::npos;
    pos = json.find(':', pos + search.size());
    if (pos == std::string::npos)
        return std::string::npos;
    pos = json.find_first_not_of(" \t\n\r", pos + 1);
    return pos;
}

}   // namespace

std::optional<std::string> read_object(const std::string& json, std::string_view key)
{
    auto pos = value_start(json, key);
    if (pos == std::string::npos || json[pos] != '{')
        return std::nullopt;

    int  depth     = 0;
    bool in_string = false;
    for (size_t i = pos; i < json.size(); ++i)
    {
        char c = json[i];
        if (in_string)
        {
            if (c == '\\')
                ++i;
            else if (c == '"')
                in_string = false;
            continue;
        }
        if (c == '"')
            in_string = true;
        else if (c == '{')
            ++depth;
        else if (c == '}')
        {
            if (--depth == 0)
                return json.substr(pos, i - pos + 1);
        }
    }
    return std::nullopt;
}

std::optional<double> read_number(const std::string& json, std::string_view key)
{
    auto pos = value_start(json, key);
    if (pos == std::string::npos)
        return std::nullopt;

    const char* begin = json.c_str() + pos;
    char*       end   = nullptr;
    errno             = 0;
    double v          = std::strtod(begin, &end);
    if (end == begin || errno == ERANGE || !std::isfinite(v))
        return std::nullopt;
    return v;
}

std::optional<bool> read_bool(const std::string& json, std::string_view key)
{
    auto pos = value_start(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    if (json.compare(pos, 4, "true") == 0)
        return true;
    if (json.compare(pos, 5, "false") == 0)
        return false;
    return std::nullopt;
}

std::string number(double v)
{
    std::ostringstream os;
    os << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
    return os.str();
}

}   // namespace cutline::json
