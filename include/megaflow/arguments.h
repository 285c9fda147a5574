#pragma once

#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace megaflow {

// Command-line arguments: `name=value` pairs plus bare positional words.
// A later `name=value` replaces an earlier one.
class Arguments
{
public:
    using size_type = std::map<std::string, std::string>::size_type;

    bool contains(const std::string& name) const;

    std::string getValue(const std::string& name, const std::string& defaultValue = "") const;

    // every name=value pair, sorted by name
    const std::map<std::string, std::string>& values() const { return mValues; }

    const std::vector<std::string>& positionals() const { return mPositionals; }

    bool empty() const;

    size_type size() const;

private:
    friend class ArgumentsParser;

    friend std::ostream& operator<<(std::ostream& os, const Arguments& arguments);

    std::map<std::string, std::string> mValues;
    std::vector<std::string> mPositionals;
};

std::ostream& operator<<(std::ostream& os, const Arguments& arguments);


class ArgumentsParser
{
public:
    static Arguments parse(int argc, char* argv[]);

private:
    // false for a word without '='
    static bool parseOneArgument(const std::string& argument, std::pair<std::string, std::string>& nameValue);
};

}
