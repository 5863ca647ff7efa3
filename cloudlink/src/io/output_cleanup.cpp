#include "io/output_cleanup.hpp"

#include <cctype>
#include <regex>
#include <sstream>
#include <vector>

namespace cloudlink::io
{
    namespace
    {

        constexpr const char *kClixmlHeader = "#< CLIXML";

        bool startsWith(const std::string &value, const std::string &prefix)
        {
            return value.compare(0, prefix.size(), prefix) == 0;
        }

        int hexValue(char ch)
        {
            if (ch >= '0' && ch <= '9')
            {
                return ch - '0';
            }
            const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
            if (lower >= 'a' && lower <= 'f')
            {
                return lower - 'a' + 10;
            }
            return -1;
        }

    } // namespace

    std::string trimCopy(const std::string &value)
    {
        size_t begin = 0;
        size_t end = value.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])))
        {
            ++begin;
        }
        while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])))
        {
            --end;
        }
        return value.substr(begin, end - begin);
    }

    // "_x000D__x000A_" -> "\r\n"; only the ASCII range is decoded, anything else is kept verbatim.
    std::string decodeClixmlEscapes(const std::string &value)
    {
        std::string out;
        out.reserve(value.size());
        for (size_t i = 0; i < value.size(); ++i)
        {
            if (value[i] == '_' && i + 6 < value.size() && value[i + 1] == 'x' && value[i + 6] == '_')
            {
                int code = 0;
                bool valid = true;
                for (size_t k = i + 2; k < i + 6; ++k)
                {
                    const int digit = hexValue(value[k]);
                    if (digit < 0)
                    {
                        valid = false;
                        break;
                    }
                    code = code * 16 + digit;
                }
                if (valid && code < 0x80)
                {
                    if (code != '\r')
                    {
                        out.push_back(static_cast<char>(code));
                    }
                    i += 6;
                    continue;
                }
            }
            out.push_back(value[i]);
        }
        return out;
    }

    std::string cleanCommandOutput(const std::string &raw)
    {
        std::string text = trimCopy(raw);
        if (!startsWith(text, kClixmlHeader))
        {
            return text;
        }

        static const std::regex firstString(R"(<S[^>]*>([^<]+)</S>)");
        std::smatch match;
        if (std::regex_search(text, match, firstString) && text.find("Error") == std::string::npos)
        {
            return trimCopy(decodeClixmlEscapes(match[1].str()));
        }
        return "";
    }

    std::string cleanCommandErrors(const std::string &raw)
    {
        std::string text = trimCopy(raw);
        if (!startsWith(text, kClixmlHeader))
        {
            return text;
        }

        static const std::regex errorString(R"(<S S="Error">([^<]+)</S>)");
        std::vector<std::string> messages;
        for (auto it = std::sregex_iterator(text.begin(), text.end(), errorString); it != std::sregex_iterator(); ++it)
        {
            std::istringstream lines(decodeClixmlEscapes((*it)[1].str()));
            std::string line;
            while (std::getline(lines, line))
            {
                line = trimCopy(line);
                if (line.empty() || startsWith(line, "At line:") || startsWith(line, "+"))
                {
                    continue;
                }
                messages.push_back(line);
            }
        }

        std::string out;
        for (size_t i = 0; i < messages.size(); ++i)
        {
            if (i > 0)
            {
                out += "\n";
            }
            out += messages[i];
        }
        return out;
    }

} // namespace cloudlink::io
