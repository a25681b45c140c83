#include <relay/arguments.h>

namespace relay
{

Arguments Arguments::parse(int argc, char* argv[])
{
    Arguments arguments;

    for (auto i = 1; i < argc; ++i)
    {
        std::string argument = argv[i];

        auto begin = argument.find_first_not_of('-');

        // Nothing but dashes.
        if (begin == std::string::npos)
            continue;

        auto separator = argument.find('=', begin);

        if (separator == std::string::npos)
        {
            arguments.mValues.emplace(argument.substr(begin), std::string());
            continue;
        }

        arguments.mValues.emplace(argument.substr(begin, separator - begin),
                                  argument.substr(separator + 1));
    }

    return arguments;
}

bool Arguments::contains(const std::string& name) const
{
    return mValues.count(name) != 0;
}

bool Arguments::empty() const
{
    return mValues.empty();
}

std::size_t Arguments::size() const
{
    return mValues.size();
}

std::optional<std::string> Arguments::value(const std::string& name) const
{
    auto i = mValues.find(name);

    if (i == mValues.end())
        return std::nullopt;

    return i->second;
}

std::string Arguments::value(const std::string& name,
                             const std::string& defaultValue) const
{
    return value(name).value_or(defaultValue);
}

std::ostream& operator<<(std::ostream& ostream, const Arguments& arguments)
{
    for (auto& [name, value] : arguments.mValues)
        ostream << "  " << name << "=" << value << "\n";

    return ostream;
}

} // relay

