#pragma once

#include <map>
#include <optional>
#include <ostream>
#include <string>

namespace relay
{

// Command line arguments of the form name=value.
//
// Leading dashes are ignored so --name=value works too. A name given
// without a value has an empty value. When a name appears more than
// once, its first value is kept.
class Arguments
{
    std::map<std::string, std::string> mValues;

public:
    // Skips argv[0].
    static Arguments parse(int argc, char* argv[]);

    bool contains(const std::string& name) const;

    bool empty() const;

    std::size_t size() const;

    std::optional<std::string> value(const std::string& name) const;

    std::string value(const std::string& name,
                      const std::string& defaultValue) const;

    friend std::ostream& operator<<(std::ostream& ostream,
                                    const Arguments& arguments);
}; // Arguments

} // relay

