// main.cpp
// Interactive tester: reads a username and a token per line (JSON object or two
// space-separated words), validates both and reports their sizes and timings.
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include <BOUND/Serialization/BoundedFields.hpp>
#include <BOUND/Serialization/JSON/JsonFields.hpp>
#include <BOUND/Text/BoundedString.hpp>

using namespace BOUND::Text;
using namespace BOUND::Serialization;

// 3..16 ASCII characters
using Username = BoundedString<3, 16, 16, Scalars, AsciiOnly>;
// 1..128 alphanumeric characters, wiped on release and compared in constant time
using Token = BoundedString<1, 128, 128, Scalars, AllOf<AsciiAlphanumeric, MaxBytes<128>>, StackOnly, SecretSecurity>;

namespace
{
    constexpr std::string_view kBanner = R"(
   ___                       _          _ __ _
  / __\ ___  _   _ _ __   __| | ___  __| / _\ |_ _ __
 /__\/// _ \| | | | '_ \ / _` |/ _ \/ _` \ \| __| '__|
/ \/  \ (_) | |_| | | | | (_| |  __/ (_| |\ \ |_| |
\_____/\___/ \__,_|_| |_|\__,_|\___|\__,_\__/\__|_|
)";

    struct TesterOptions
    {
        bool quiet {false};
        bool json {false};
    };

    struct Credentials
    {
        Username username;
        Token    token;
    };

    using Clock = std::chrono::steady_clock;

    void PrintUsage(std::ostream& os, const char* program)
    {
        os << "Usage: " << program << " [--quiet] [--json] [--help]\n"
           << "  --quiet  do not print the banner and prompts\n"
           << "  --json   print one JSON object per processed line\n"
           << "  --help   show this message\n";
    }

    bool EqualsIgnoreCase(std::string_view a, std::string_view b)
    {
        return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
               });
    }

    std::string_view Trim(std::string_view text)
    {
        const auto isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
        while (!text.empty() && isSpace(text.front()))
            text.remove_prefix(1);
        while (!text.empty() && isSpace(text.back()))
            text.remove_suffix(1);
        return text;
    }

    std::string FormatSeconds(Clock::duration elapsed)
    {
        std::ostringstream os;
        os << std::fixed << std::setprecision(6) << std::chrono::duration<double>(elapsed).count();
        return os.str();
    }

    class Tester
    {
    public:
        explicit Tester(TesterOptions options)
            : m_options(options)
        {
        }

        /// @return false when the user asked to quit.
        bool ProcessLine(std::string_view rawLine)
        {
            const std::string_view line = Trim(rawLine);
            if (line.empty())
                return true;
            if (EqualsIgnoreCase(line, "exit"))
                return false;

            const auto start = Clock::now();
            auto       credentials = line.front() == '{' ? FromJson(line) : FromWords(line);
            if (!credentials)
                return true;
            const auto parsed = Clock::now();

            Report(*credentials, parsed - start, start);
            return true;
        }

    private:
        std::optional<Credentials> FromJson(std::string_view line)
        {
            auto fields = JsonFields::Parse(line);
            if (!fields)
            {
                const ParseError& error = fields.error();
                std::ostringstream os;
                os << "Failed to parse JSON: " << error.message << " (" << ToString(error.code) << ") at line "
                   << error.location.line << ", column " << error.location.column;
                Fail("json", os.str());
                return std::nullopt;
            }

            auto username = BindField<Username>(*fields, "username");
            if (!username)
            {
                FailField("Username", username.error());
                return std::nullopt;
            }
            auto token = BindField<Token>(*fields, "token");
            if (!token)
            {
                FailField("Token", token.error());
                return std::nullopt;
            }
            return Credentials {std::move(*username), std::move(*token)};
        }

        std::optional<Credentials> FromWords(std::string_view line)
        {
            std::vector<std::string> words;
            std::istringstream       is {std::string(line)};
            for (std::string word; is >> word;)
                words.push_back(std::move(word));
            if (words.size() != 2)
            {
                Fail("input", "Expected two values: username token");
                return std::nullopt;
            }

            auto username = Username::Create(words[0]);
            if (!username)
            {
                FailValue("Username", username.error());
                return std::nullopt;
            }
            auto token = Token::Create(words[1]);
            if (!token)
            {
                FailValue("Token", token.error());
                return std::nullopt;
            }
            return Credentials {std::move(*username), std::move(*token)};
        }

        void FailField(std::string_view label, const FieldError& error)
        {
            std::string message = std::string(label) + " error: " + std::string(ToString(error.code));
            if (error.cause)
                message += " (" + std::string(ToString(*error.cause)) + ")";
            else
                message += " '" + error.key + "'";
            Fail(label, message);
        }

        void FailValue(std::string_view label, BoundedStringError error)
        {
            Fail(label, std::string(label) + " error: " + std::string(ToString(error)));
        }

        void Fail(std::string_view stage, const std::string& message)
        {
            if (!m_options.json)
            {
                std::cerr << message << "\n";
                return;
            }
            std::string out = "{\"ok\":false,\"stage\":";
            WriteJsonString(out, stage);
            out += ",\"error\":";
            WriteJsonString(out, message);
            out += "}";
            std::cout << out << std::endl;
        }

        void Report(const Credentials& credentials, Clock::duration parseElapsed, Clock::time_point start)
        {
            const Username& user  = credentials.username;
            const Token&    token = credentials.token;

            if (m_options.json)
            {
                std::string out = "{\"ok\":true,\"username\":" + ToJson(user);
                out += ",\"usernameBytes\":" + std::to_string(user.ByteLength());
                out += ",\"usernameChars\":" + std::to_string(user.LogicalLength());
                out += ",\"token\":" + ToJson(token);
                out += ",\"tokenBytes\":" + std::to_string(token.ByteLength());
                out += ",\"tokenChars\":" + std::to_string(token.LogicalLength());
                out += ",\"parseSeconds\":" + FormatSeconds(parseElapsed) + "}";
                std::cout << out << std::endl;
                return;
            }

            std::cout << "Username: " << user << ", bytes: " << user.ByteLength() << ", chars: " << user.LogicalLength()
                      << "\n";
            std::cout << "Token: " << token << ", bytes: " << token.ByteLength() << ", chars: " << token.LogicalLength()
                      << "\n";
            std::cout << "Parse + validation time: " << FormatSeconds(parseElapsed) << " seconds\n";
            std::cout << "Total cycle time (including console render): " << FormatSeconds(Clock::now() - start)
                      << " seconds\n\n";
        }

        TesterOptions m_options;
    };
}// namespace

int main(int argc, char** argv)
{
    TesterOptions options;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--quiet")
            options.quiet = true;
        else if (arg == "--json")
            options.json = true;
        else if (arg == "--help" || arg == "-h")
        {
            PrintUsage(std::cout, argv[0]);
            return 0;
        }
        else
        {
            std::cerr << "Unknown option: " << arg << "\n";
            PrintUsage(std::cerr, argv[0]);
            return 2;
        }
    }

    if (!options.quiet)
    {
        std::cout << "\x1b[32m" << kBanner << "\x1b[0m\n";
        std::cout << "Interactive BoundedString Tester\n";
        std::cout << "Enter JSON like {\"username\":\"Alice\",\"token\":\"a1b2c3d4e5\"}\n";
        std::cout << "Or enter space-separated: username token\n";
        std::cout << "Type 'exit' to quit.\n\n";
    }

    Tester tester(options);
    std::string line;
    while (true)
    {
        if (!options.quiet)
            std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line))
            break;
        if (!tester.ProcessLine(line))
            break;
    }

    if (!options.quiet)
        std::cout << "Exiting interactive tester.\n";
    return 0;
}
