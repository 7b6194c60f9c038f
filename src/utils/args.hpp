#pragma once
#include <string>
#include <vector>
#include <set>

// Check if a flag exists in command line args
inline bool hasFlag(int argc, char **argv, const std::string &flag)
{
    for (int i = 1; i < argc; i++)
    {
        if (std::string(argv[i]) == flag)
        {
            return true;
        }
    }
    return false;
}

// Get a string argument from command line
inline std::string getArg(int argc, char **argv, const std::string &flag, const std::string &defaultValue)
{
    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == flag && i + 1 < argc)
        {
            return argv[i + 1];
        }
    }
    return defaultValue;
}

// Get an integer argument from command line
inline int getArg(int argc, char **argv, const std::string &flag, int defaultValue)
{
    std::string value = getArg(argc, argv, flag, "");
    if (value.empty())
    {
        return defaultValue;
    }
    return std::stoi(value);
}

// Get a floating point argument from command line
inline double getArg(int argc, char **argv, const std::string &flag, double defaultValue)
{
    std::string value = getArg(argc, argv, flag, "");
    if (value.empty())
    {
        return defaultValue;
    }
    return std::stod(value);
}

// Index of the last occurrence of any of the given flags, -1 when absent
inline int lastFlagIndex(int argc, char **argv, const std::vector<std::string> &flags)
{
    int found = -1;
    for (int i = 1; i < argc; i++)
    {
        for (const auto &flag : flags)
        {
            if (std::string(argv[i]) == flag)
            {
                found = i;
            }
        }
    }
    return found;
}

// Collect arguments that are neither flags nor values of flags taking one
inline std::vector<std::string> getPositionalArgs(int argc, char **argv, const std::set<std::string> &valueFlags)
{
    std::vector<std::string> positional;
    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (valueFlags.count(arg))
        {
            i++; // skip its value
            continue;
        }
        if (arg.size() > 1 && arg[0] == '-')
        {
            continue;
        }
        positional.push_back(arg);
    }
    return positional;
}
