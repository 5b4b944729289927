#include "ArpTableReader.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

namespace lanwatch::scanner
{
    namespace
    {
        std::string_view StripPunctuation(std::string_view token)
        {
            while (!token.empty() && (token.front() == '(' || token.front() == '['))
                token.remove_prefix(1);
            while (!token.empty() && (token.back() == ')' || token.back() == ']' || token.back() == ','))
                token.remove_suffix(1);
            return token;
        }

        int HexValue(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            return -1;
        }
    }

    ArpTableReader::ArpTableReader(const PlatformCommands &commands, ProcessRunner &runner,
                                   std::chrono::milliseconds timeout)
        : m_commands(commands), m_runner(runner), m_timeout(timeout)
    {
    }

    std::optional<Tins::IPv4Address> ArpTableReader::ParseIpToken(std::string_view token)
    {
        token = StripPunctuation(token);
        if (token.empty() || token.size() > 15)
            return std::nullopt;

        int dots = 0;
        int digits = 0;
        int octet = 0;
        for (char c : token)
        {
            if (c == '.')
            {
                if (digits == 0)
                    return std::nullopt;
                ++dots;
                digits = 0;
                octet = 0;
            }
            else if (c >= '0' && c <= '9')
            {
                octet = octet * 10 + (c - '0');
                if (++digits > 3 || octet > 255)
                    return std::nullopt;
            }
            else
            {
                return std::nullopt;
            }
        }
        if (dots != 3 || digits == 0)
            return std::nullopt;

        try
        {
            return Tins::IPv4Address(std::string(token));
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }

    std::optional<common::MacAddress> ArpTableReader::ParseMacToken(std::string_view token)
    {
        token = StripPunctuation(token);

        char separator = 0;
        std::vector<int> octets;
        int value = 0;
        int digits = 0;

        for (char c : token)
        {
            if (c == ':' || c == '-')
            {
                if (separator == 0)
                    separator = c;
                if (c != separator || digits == 0)
                    return std::nullopt;
                octets.push_back(value);
                value = 0;
                digits = 0;
                continue;
            }

            int hex = HexValue(c);
            if (hex < 0 || ++digits > 2)
                return std::nullopt;
            value = value * 16 + hex;
        }
        if (digits == 0)
            return std::nullopt;
        octets.push_back(value);

        if (octets.size() != 6)
            return std::nullopt;

        std::ostringstream normalized;
        for (size_t i = 0; i < octets.size(); ++i)
        {
            static const char *hexdigits = "0123456789abcdef";
            if (i)
                normalized << ':';
            normalized << hexdigits[octets[i] >> 4] << hexdigits[octets[i] & 0xF];
        }

        try
        {
            return common::MacAddress(normalized.str());
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }

    ArpTable ArpTableReader::Parse(const std::string &text)
    {
        ArpTable table;
        std::istringstream lines(text);
        std::string line;

        while (std::getline(lines, line))
        {
            std::istringstream tokens(line);
            std::string token;
            std::optional<Tins::IPv4Address> ip;
            std::optional<common::MacAddress> mac;

            while (tokens >> token && !(ip && mac))
            {
                if (!ip)
                {
                    ip = ParseIpToken(token);
                    if (ip)
                        continue;
                }
                if (!mac)
                    mac = ParseMacToken(token);
            }

            if (!ip || !mac)
                continue;
            if (*mac == common::MacAddress() || !mac->is_unicast())
                continue;

            table.emplace(*ip, *mac);
        }

        return table;
    }

    ArpTable ArpTableReader::ReadFallbackFile(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
            return {};

        std::stringstream contents;
        contents << file.rdbuf();
        return Parse(contents.str());
    }

    ArpTable ArpTableReader::Read()
    {
        ProcessResult result = m_runner.Run(m_commands.NeighborTableCommand(), m_timeout);
        if (result.Succeeded())
            return Parse(result.output);

        std::optional<std::string> fallback = m_commands.NeighborTableFallbackFile();
        if (fallback)
        {
            ArpTable table = ReadFallbackFile(*fallback);
            if (!table.empty())
                return table;
        }

        std::cerr << "[ARP] Neighbor table unavailable ("
                  << (!result.launched ? "utility not found" : result.timed_out ? "timed out" : "exit code " + std::to_string(result.exit_code))
                  << "), skipping MAC enrichment\n";
        return {};
    }
}
