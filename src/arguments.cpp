#include "megaflow/arguments.h"

namespace megaflow {

std::string Arguments::getValue(const std::string& name, const std::string& defaultValue) const
{
    auto it = mValues.find(name);
    return it == mValues.end() ? defaultValue : it->second;
}

bool Arguments::empty() const
{
    return mValues.empty() && mPositionals.empty();
}

Arguments::size_type Arguments::size() const
{
    return mValues.size() + mPositionals.size();
}

bool Arguments::contains(const std::string& name) const
{
    return mValues.count(name) > 0;
}

std::ostream& operator<<(std::ostream& os, const Arguments& arguments)
{
    for (auto& positional : arguments.mPositionals)
    {
        os << "  " << positional << std::endl;
    }
    for (auto& argument : arguments.mValues)
    {
        os << "  " << argument.first << "=" << argument.second << std::endl;
    }
    return os;
}

Arguments ArgumentsParser::parse(int argc, char* argv[])
{
    Arguments arguments;

    for (int i = 1; i < argc; ++i)
    {
        std::pair<std::string, std::string> nameValue;

        if (parseOneArgument(argv[i], nameValue))
        {
            arguments.mValues[nameValue.first] = nameValue.second;
        }
        else
        {
            arguments.mPositionals.emplace_back(argv[i]);
        }
    }
    return arguments;
}

bool ArgumentsParser::parseOneArgument(const std::string& argument, std::pair<std::string, std::string>& nameValue)
{
    // URLs may carry '=' in their fragment; a name never contains ':' or '/'
    const auto pos = argument.find('=');
    if (pos == argument.npos || pos == 0 || argument.find_first_of(":/#") < pos)
    {
        return false;
    }

    nameValue = std::make_pair(argument.substr(0, pos), argument.substr(pos + 1));
    return true;
}

}
