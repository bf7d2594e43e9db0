#include "lazyjson_reader.hpp"

#include <exception>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#ifdef VERBOSE
#  define TRACE(str) (std::cerr << str << std::endl)
#  define TRACEFUNC TRACE(__PRETTY_FUNCTION__)
#else
#  define TRACE(str)
#  define TRACEFUNC
#endif

namespace
{

void write_quoted_string(std::ostream& out, const std::string_view str)
{
    static const char hex_digits[] = "0123456789abcdef";

    out << '"';
    for (const char c : str)
    {
        switch (c)
        {
        case '"':
            out << "\\\"";
            break;
        case '\\':
            out << "\\\\";
            break;
        case '\n':
            out << "\\n";
            break;
        case '\r':
            out << "\\r";
            break;
        case '\t':
            out << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20)
            {
                out << "\\u00"
                    << hex_digits[(c >> 4) & 0xF]
                    << hex_digits[c & 0xF];
            }
            else
            {
                out << c;
            }
        }
    }
    out << '"';
}

void write_element(std::ostream& out, const lazyjson::element& e)
{
    TRACEFUNC;

    switch (e.type())
    {
    case lazyjson::Object:
    {
        bool is_first = true;
        out << '{';
        for (const auto& [key, member] : e.members())
        {
            out << (is_first ? "" : ", ");
            write_quoted_string(out, key);
            out << ": ";
            write_element(out, member); // NOTE: recursion
            is_first = false;
        }
        out << '}';
        break;
    }
    case lazyjson::Array:
    {
        bool is_first = true;
        out << '[';
        for (const lazyjson::element& item : e.items())
        {
            out << (is_first ? "" : ", ");
            write_element(out, item); // NOTE: recursion
            is_first = false;
        }
        out << ']';
        break;
    }
    case lazyjson::String:
        write_quoted_string(out, e.raw());
        break;
    default:
        out << e.raw();
    }
}

// "daily.data.0.time" -> {"daily", "data", "0", "time"}
std::vector<std::string> split_path(const std::string& path)
{
    std::vector<std::string> segments;
    if (path.empty())
    {
        return segments;
    }

    std::string::size_type begin = 0;
    while (true)
    {
        const std::string::size_type end = path.find('.', begin);
        segments.push_back(path.substr(begin, end - begin));
        if (end == std::string::npos)
        {
            break;
        }
        begin = end + 1;
    }

    return segments;
}

bool is_index(const std::string& segment)
{
    if (segment.empty())
    {
        return false;
    }
    for (const char c : segment)
    {
        if (c < '0' || c > '9')
        {
            return false;
        }
    }

    return true;
}

lazyjson::value lookup(lazyjson::value v, const std::vector<std::string>& segments)
{
    TRACEFUNC;

    for (const std::string& segment : segments)
    {
        TRACE("  " << v.type() << " -> " << segment);

        if (v.type() == lazyjson::Array && is_index(segment))
        {
            v = v[static_cast<std::size_t>(std::stoul(segment))];
        }
        else
        {
            v = v[segment];
        }
    }

    return v;
}

void print(const std::string& path, const lazyjson::value& v)
{
    std::cout << path << ": ";

    switch (v.type())
    {
    case lazyjson::Object:
        write_element(std::cout, v.as_object().materialize());
        break;
    case lazyjson::Array:
        write_element(std::cout, v.as_array().materialize());
        break;
    case lazyjson::String:
        write_quoted_string(std::cout, v.raw());
        break;
    default:
        std::cout << v.raw();
    }

    std::cout << std::endl;
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 3)
    {
        std::cerr << "usage: " << argv[0] << " <file|-> <path>..." << std::endl;
        return -1;
    }

    std::ifstream file;
    std::istream* input = &std::cin;
    if (std::string(argv[1]) != "-")
    {
        file.open(argv[1], std::ios::binary);
        if (!file)
        {
            std::cerr << "EXCEPTION: cannot open " << argv[1] << std::endl;
            return -1;
        }
        input = &file;
    }

    try
    {
        //=================================
        lazyjson::istream_source source(*input, 32);
        lazyjson::value root = lazyjson::load(source);
        //=================================

        // Paths are resolved in the order given; anything before the
        // current position is gone
        for (int i = 2; i < argc; ++i)
        {
            const std::string path = argv[i];

            try
            {
                print(path, lookup(root, split_path(path)));
            }
            catch (const std::out_of_range& e)
            {
                std::cout << path << ": not found (" << e.what() << ")" << std::endl;
            }
        }
    }
    catch (std::exception& e)
    {
        std::cerr << "EXCEPTION: " << e.what() << std::endl;
        return -1;
    }

    return 0;
}

/***

$ ./lazyjson_get forecast.json currently.time daily.data.0.summary flags.units
currently.time: 1696017600
daily.data.0.summary: "Partly cloudy throughout the day."
flags.units: "us"

$ ./lazyjson_get forecast.json flags.units currently.time
flags.units: "us"
currently.time: not found (key not found: currently)

 ***/
