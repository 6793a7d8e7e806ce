#include <boost/algorithm/string/case_conv.hpp>

#include "transport.hpp"

void Response::set_header(std::string_view name, std::string_view value)
{
    headers[boost::algorithm::to_lower_copy(std::string{name})] =
        std::string{value};
}

std::optional<std::string> Response::header(std::string_view name) const
{
    auto found = headers.find(boost::algorithm::to_lower_copy(std::string{name}));
    if (found == headers.end())
    {
        return std::nullopt;
    }
    return found->second;
}
