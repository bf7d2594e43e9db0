#ifndef LAZYJSON_READER_H
#define LAZYJSON_READER_H

#include <array>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#ifndef LJR_NESTING_LIMIT
#define LJR_NESTING_LIMIT 32
#endif

#ifndef LJR_DEFAULT_CHUNK_SIZE
#define LJR_DEFAULT_CHUNK_SIZE 64
#endif

#define LJR_STRINGIFY(S) LJR_STRINGIFY_HELPER(S)
#define LJR_STRINGIFY_HELPER(S) #S

namespace lazyjson
{

// The external collaborator supplying the raw JSON text. The decoder pulls
// chunks only when it has consumed everything it was given so far.
class chunk_source
{
public:

    virtual ~chunk_source() = default;

    // Returns the next chunk of input. An empty chunk signals end-of-input.
    // The returned view must stay valid until the next call.
    virtual std::string_view next_chunk() = 0;
}; // class chunk_source

// Hands out an in-memory buffer in chunks of a fixed size
class buffer_source final : public chunk_source
{
private:

    std::string_view m_buffer;
    std::size_t m_chunk_size;
    std::size_t m_offset = 0;
    std::size_t m_chunks_read = 0;

public:

    explicit buffer_source(
        const std::string_view buffer,
        const std::size_t chunk_size = LJR_DEFAULT_CHUNK_SIZE)
    : m_buffer(buffer)
    , m_chunk_size(chunk_size)
    {
        if (m_chunk_size == 0)
        {
            throw std::invalid_argument("buffer_source: chunk size is zero");
        }
    }

    std::string_view next_chunk() override
    {
        const std::string_view chunk = m_buffer.substr(m_offset, m_chunk_size);
        m_offset += chunk.size();
        ++m_chunks_read;

        return chunk;
    }

    // Number of calls to next_chunk(), including the one that signalled
    // end-of-input
    std::size_t chunks_read() const noexcept
    {
        return m_chunks_read;
    }
}; // class buffer_source

class istream_source final : public chunk_source
{
private:

    std::istream& m_stream;
    std::vector<char> m_buffer;

public:

    explicit istream_source(
        std::istream& stream,
        const std::size_t chunk_size = LJR_DEFAULT_CHUNK_SIZE)
    : m_stream(stream)
    , m_buffer(chunk_size)
    {
        if (chunk_size == 0)
        {
            throw std::invalid_argument("istream_source: chunk size is zero");
        }
    }

    std::string_view next_chunk() override
    {
        if (!m_stream)
        {
            return {};
        }

        m_stream.read(m_buffer.data(), static_cast<std::streamsize>(m_buffer.size()));

        return {m_buffer.data(), static_cast<std::size_t>(m_stream.gcount())};
    }
}; // class istream_source

// Adapts any callable producing successive chunks, e.g. a lambda draining a
// socket or a chunked HTTP response body
class function_source final : public chunk_source
{
private:

    std::function<std::string()> m_next;
    std::string m_chunk;

public:

    explicit function_source(std::function<std::string()> next)
    : m_next(std::move(next))
    {
    }

    std::string_view next_chunk() override
    {
        m_chunk = m_next();

        return m_chunk;
    }
}; // class function_source

enum token_type
{
    BEGIN_OBJECT,
    END_OBJECT,
    BEGIN_ARRAY,
    END_ARRAY,
    NAME_SEPARATOR,
    VALUE_SEPARATOR,
    STRING,
    NUMBER,
    TRUE_LITERAL,
    FALSE_LITERAL,
    NULL_LITERAL,
    END_OF_INPUT,
};

inline const char* token_name(const token_type type) noexcept
{
    switch (type)
    {
    case BEGIN_OBJECT:
        return "'{'";
    case END_OBJECT:
        return "'}'";
    case BEGIN_ARRAY:
        return "'['";
    case END_ARRAY:
        return "']'";
    case NAME_SEPARATOR:
        return "':'";
    case VALUE_SEPARATOR:
        return "','";
    case STRING:
        return "string";
    case NUMBER:
        return "number";
    case TRUE_LITERAL:
        return "true";
    case FALSE_LITERAL:
        return "false";
    case NULL_LITERAL:
        return "null";
    case END_OF_INPUT:
        return "end of input";
    }

    return "unknown token"; // LCOV_EXCL_LINE
}

inline std::ostream& operator<<(std::ostream& out, const token_type type)
{
    return out << token_name(type);
}

class parse_error : public std::exception
{
public:

    enum error_reason
    {
        UNKNOWN,
        INVALID_ESCAPE_SEQUENCE,
        EXPECTED_UTF16_LOW_SURROGATE,
        INVALID_UTF16_CHARACTER,
        UNESCAPED_CONTROL_CHARACTER,
        INVALID_NUMBER,
        INVALID_LITERAL,
        UNEXPECTED_CHARACTER,
        UNEXPECTED_TOKEN,
        TRUNCATED_INPUT,
        EXCEEDED_NESTING_LIMIT,
    };

private:

    std::size_t m_offset;
    error_reason m_reason;

    template<typename Context>
    static std::size_t get_offset(const Context& context) noexcept
    {
        const std::size_t read_offset = context.read_offset();

        return (read_offset != 0) ? (read_offset - 1) : 0;
    }

public:

    template<typename Context>
    explicit parse_error(
        const Context& context,
        const error_reason reason) noexcept
    : m_offset(get_offset(context))
    , m_reason(reason)
    {
    }

    static const char* describe(const error_reason reason) noexcept
    {
        switch (reason)
        {
        case UNKNOWN:
            return "Unknown parse error";
        case INVALID_ESCAPE_SEQUENCE:
            return "Invalid escape sequence";
        case EXPECTED_UTF16_LOW_SURROGATE:
            return "Expected UTF-16 low surrogate";
        case INVALID_UTF16_CHARACTER:
            return "Invalid UTF-16 character";
        case UNESCAPED_CONTROL_CHARACTER:
            return "Unescaped control character";
        case INVALID_NUMBER:
            return "Invalid number";
        case INVALID_LITERAL:
            return "Invalid literal";
        case UNEXPECTED_CHARACTER:
            return "Unexpected character";
        case UNEXPECTED_TOKEN:
            return "Unexpected token";
        case TRUNCATED_INPUT:
            return "Truncated input";
        case EXCEEDED_NESTING_LIMIT:
            return "Exceeded nesting limit ("
                LJR_STRINGIFY(LJR_NESTING_LIMIT) ")";
        }

        return ""; // to suppress compiler warnings -- LCOV_EXCL_LINE
    }

    std::size_t offset() const noexcept
    {
        return m_offset;
    }

    error_reason reason() const noexcept
    {
        return m_reason;
    }

    const char* what() const noexcept override
    {
        return describe(m_reason);
    }
}; // class parse_error

// LCOV_EXCL_START
inline std::ostream& operator<<(
    std::ostream& out,
    const parse_error::error_reason reason)
{
    switch (reason)
    {
        case parse_error::UNKNOWN:
            return out << "UNKNOWN";
        case parse_error::INVALID_ESCAPE_SEQUENCE:
            return out << "INVALID_ESCAPE_SEQUENCE";
        case parse_error::EXPECTED_UTF16_LOW_SURROGATE:
            return out << "EXPECTED_UTF16_LOW_SURROGATE";
        case parse_error::INVALID_UTF16_CHARACTER:
            return out << "INVALID_UTF16_CHARACTER";
        case parse_error::UNESCAPED_CONTROL_CHARACTER:
            return out << "UNESCAPED_CONTROL_CHARACTER";
        case parse_error::INVALID_NUMBER:
            return out << "INVALID_NUMBER";
        case parse_error::INVALID_LITERAL:
            return out << "INVALID_LITERAL";
        case parse_error::UNEXPECTED_CHARACTER:
            return out << "UNEXPECTED_CHARACTER";
        case parse_error::UNEXPECTED_TOKEN:
            return out << "UNEXPECTED_TOKEN";
        case parse_error::TRUNCATED_INPUT:
            return out << "TRUNCATED_INPUT";
        case parse_error::EXCEEDED_NESTING_LIMIT:
            return out << "EXCEEDED_NESTING_LIMIT";
    }

    return out << "UNKNOWN";
}
// LCOV_EXCL_STOP

// Malformed input at the character level
class lex_error : public parse_error
{
private:

    std::string m_message;

public:

    template<typename Context>
    explicit lex_error(
        const Context& context,
        const error_reason reason,
        const std::string_view text = "")
    : parse_error(context, reason)
    {
        if (!text.empty())
        {
            m_message.append(describe(reason)).append(": ").append(text);
        }
    }

    const char* what() const noexcept override
    {
        return m_message.empty() ? parse_error::what() : m_message.c_str();
    }
}; // class lex_error

// A well-formed token showing up where the grammar does not allow it
class unexpected_token_error : public parse_error
{
private:

    std::string_view m_expected;
    token_type m_actual;
    std::string m_message;

public:

    template<typename Context>
    explicit unexpected_token_error(
        const Context& context,
        const std::string_view expected,
        const token_type actual)
    : parse_error(context, UNEXPECTED_TOKEN)
    , m_expected(expected)
    , m_actual(actual)
    {
        m_message.append(describe(UNEXPECTED_TOKEN))
            .append(": expected ")
            .append(expected)
            .append(", got ")
            .append(token_name(actual));
    }

    // Must point to static storage
    std::string_view expected() const noexcept
    {
        return m_expected;
    }

    token_type actual() const noexcept
    {
        return m_actual;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }
}; // class unexpected_token_error

// The source ran dry in the middle of a token or of a structure
class truncated_input_error : public parse_error
{
public:

    template<typename Context>
    explicit truncated_input_error(const Context& context) noexcept
    : parse_error(context, TRUNCATED_INPUT)
    {
    }
}; // class truncated_input_error

class missing_key_error : public std::out_of_range
{
private:

    std::string m_key;

public:

    explicit missing_key_error(const std::string_view key)
    : std::out_of_range("key not found: " + std::string(key))
    , m_key(key)
    {
    }

    const std::string& key() const noexcept
    {
        return m_key;
    }
}; // class missing_key_error

class index_out_of_range_error : public std::out_of_range
{
private:

    std::size_t m_index;

public:

    explicit index_out_of_range_error(const std::size_t index)
    : std::out_of_range("index out of range: " + std::to_string(index))
    , m_index(index)
    {
    }

    std::size_t index() const noexcept
    {
        return m_index;
    }
}; // class index_out_of_range_error

class type_mismatch_error : public std::invalid_argument
{
public:

    using std::invalid_argument::invalid_argument;
};

class stream_exhausted_error : public std::logic_error
{
public:

    using std::logic_error::logic_error;
};

class partially_consumed_error : public std::logic_error
{
public:

    using std::logic_error::logic_error;
};

namespace detail
{

inline constexpr int end_of_input = -1;

// Tells whether a character is acceptable JSON whitespace to separate tokens
inline bool is_whitespace(const int c)
{
    switch (c)
    {
    case ' ':
    case '\n':
    case '\r':
    case '\t':
        return true;
    }

    return false;
}

inline bool is_digit(const int c)
{
    return c >= '0' && c <= '9';
}

inline bool is_hex_digit(const int c)
{
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

inline bool is_alpha(const int c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

// Characters that may continue a number once it has started
inline bool is_number_char(const int c)
{
    switch (c)
    {
    case '+':
    case '-':
    case '.':
    case 'e':
    case 'E':
        return true;
    default:
        return is_digit(c);
    }
}

// This exception is thrown internally by the functions dealing with UTF-16
// escape sequences and is not propagated outside of the library
struct encoding_error
{
};

inline std::uint32_t utf16_to_utf32(std::uint16_t high, std::uint16_t low)
{
    if (high <= 0xD7FF || high >= 0xE000)
    {
        if (low != 0)
        {
            // Since the high code unit is not a surrogate, the low code unit
            // should be zero
            throw encoding_error();
        }

        return high;
    }

    if (high > 0xDBFF) // we already know high >= 0xD800
    {
        throw encoding_error();
    }

    if (low < 0xDC00 || low > 0xDFFF)
    {
        throw encoding_error();
    }

    high -= 0xD800;
    low -= 0xDC00;

    return 0x010000 + ((static_cast<std::uint32_t>(high) << 10) | low);
}

inline void append_utf8(std::string& out, const std::uint32_t code_point)
{
    if (code_point <= 0x7F)
    {
        out.push_back(static_cast<char>(code_point));
    }
    else if (code_point <= 0x7FF)
    {
        out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
    else if (code_point <= 0xFFFF)
    {
        out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
    else if (code_point <= 0x10FFFF)
    {
        out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
    else
    {
        throw encoding_error();
    }
}

inline std::uint8_t parse_hex_digit(const int c)
{
    if (is_digit(c))
    {
        return static_cast<std::uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f')
    {
        return static_cast<std::uint8_t>(c - 'a' + 0xa);
    }
    if (c >= 'A' && c <= 'F')
    {
        return static_cast<std::uint8_t>(c - 'A' + 0xa);
    }

    throw encoding_error();
}

// One character of lookahead over a chunk_source. Holds the current chunk
// and nothing else.
class cursor
{
private:

    chunk_source& m_source;
    std::string_view m_chunk;
    std::size_t m_position = 0;
    std::size_t m_read_offset = 0;
    bool m_exhausted = false;

    bool fill()
    {
        if (m_position < m_chunk.size())
        {
            return true;
        }
        if (m_exhausted)
        {
            return false;
        }

        m_chunk = m_source.next_chunk();
        m_position = 0;

        if (m_chunk.empty())
        {
            // Never ask the source again
            m_exhausted = true;
            return false;
        }

        return true;
    }

public:

    explicit cursor(chunk_source& source) noexcept
    : m_source(source)
    {
    }

    cursor(const cursor&) = delete;
    cursor& operator=(const cursor&) = delete;

    int peek()
    {
        if (!fill())
        {
            return end_of_input;
        }

        return static_cast<unsigned char>(m_chunk[m_position]);
    }

    int advance()
    {
        if (!fill())
        {
            return end_of_input;
        }

        ++m_read_offset;

        return static_cast<unsigned char>(m_chunk[m_position++]);
    }

    std::size_t read_offset() const noexcept
    {
        return m_read_offset;
    }

    bool exhausted() const noexcept
    {
        return m_exhausted;
    }
}; // class cursor

struct token
{
    token_type type = END_OF_INPUT;

    // Decoded content of strings, text of numbers. Left empty when the token
    // was read in skip mode.
    std::string text;
};

class tokenizer
{
private:

    cursor m_cursor;

    void skip_whitespace()
    {
        while (is_whitespace(m_cursor.peek()))
        {
            m_cursor.advance();
        }
    }

    int advance_or_throw()
    {
        const int c = m_cursor.advance();
        if (c == end_of_input)
        {
            throw truncated_input_error(m_cursor);
        }

        return c;
    }

    std::uint16_t read_utf16_escape()
    {
        std::uint16_t result = 0;

        for (int i = 0; i < 4; ++i)
        {
            const int c = advance_or_throw();
            if (!is_hex_digit(c))
            {
                throw lex_error(
                    m_cursor,
                    parse_error::INVALID_ESCAPE_SEQUENCE);
            }

            result = static_cast<std::uint16_t>((result << 4) | parse_hex_digit(c));
        }

        return result;
    }

    // Assumes the opening quote has already been consumed.
    // Passing a null out only validates.
    void read_string(std::string* const out)
    {
        std::uint16_t high_surrogate = 0;

        while (true)
        {
            int c = advance_or_throw();

            if (high_surrogate != 0 && c != '\\')
            {
                throw lex_error(
                    m_cursor,
                    parse_error::EXPECTED_UTF16_LOW_SURROGATE);
            }

            if (c == '"')
            {
                return;
            }

            if (c < 0x20)
            {
                throw lex_error(
                    m_cursor,
                    parse_error::UNESCAPED_CONTROL_CHARACTER);
            }

            if (c != '\\')
            {
                if (out)
                {
                    out->push_back(static_cast<char>(c));
                }
                continue;
            }

            c = advance_or_throw();

            if (high_surrogate != 0 && c != 'u')
            {
                throw lex_error(
                    m_cursor,
                    parse_error::EXPECTED_UTF16_LOW_SURROGATE);
            }

            char unescaped = 0;

            switch (c)
            {
            case '"':
                unescaped = '"';
                break;
            case '\\':
                unescaped = '\\';
                break;
            case '/':
                unescaped = '/';
                break;
            case 'b':
                unescaped = '\b';
                break;
            case 'f':
                unescaped = '\f';
                break;
            case 'n':
                unescaped = '\n';
                break;
            case 'r':
                unescaped = '\r';
                break;
            case 't':
                unescaped = '\t';
                break;
            case 'u':
                break;
            default:
                throw lex_error(
                    m_cursor,
                    parse_error::INVALID_ESCAPE_SEQUENCE);
            }

            if (c != 'u')
            {
                if (out)
                {
                    out->push_back(unescaped);
                }
                continue;
            }

            const std::uint16_t code_unit = read_utf16_escape();

            try
            {
                if (high_surrogate != 0)
                {
                    const std::uint32_t code_point =
                        utf16_to_utf32(high_surrogate, code_unit);
                    high_surrogate = 0;
                    if (out)
                    {
                        append_utf8(*out, code_point);
                    }
                }
                else if (code_unit >= 0xD800 && code_unit <= 0xDBFF)
                {
                    high_surrogate = code_unit;
                }
                else
                {
                    const std::uint32_t code_point =
                        utf16_to_utf32(code_unit, 0);
                    if (out)
                    {
                        append_utf8(*out, code_point);
                    }
                }
            }
            catch (const encoding_error&)
            {
                throw lex_error(
                    m_cursor,
                    parse_error::INVALID_UTF16_CHARACTER);
            }
        }
    }

    // Validates the number against the JSON grammar while reading it.
    // Assumes first has already been consumed.
    void read_number(const int first, std::string* const out)
    {
        enum
        {
            SIGN_OR_FIRST_DIGIT,
            FIRST_DIGIT,
            AFTER_LEADING_ZERO,
            INTEGRAL_PART,
            FRACTIONAL_PART_FIRST_DIGIT,
            FRACTIONAL_PART,
            EXPONENT_SIGN_OR_FIRST_DIGIT,
            EXPONENT_FIRST_DIGIT,
            EXPONENT,
        } state = SIGN_OR_FIRST_DIGIT;

        int c = first;

        while (true)
        {
            switch (state)
            {
            case SIGN_OR_FIRST_DIGIT:
                if (c == '-') // leading plus sign not allowed
                {
                    state = FIRST_DIGIT;
                    break;
                }
                [[fallthrough]];
            case FIRST_DIGIT:
                if (c == '0')
                {
                    // If zero is the first digit, then it must be the ONLY
                    // digit of the integral part
                    state = AFTER_LEADING_ZERO;
                    break;
                }
                if (is_digit(c))
                {
                    state = INTEGRAL_PART;
                    break;
                }
                throw lex_error(m_cursor, parse_error::INVALID_NUMBER);

            case INTEGRAL_PART:
                if (is_digit(c))
                {
                    break;
                }
                [[fallthrough]];
            case AFTER_LEADING_ZERO:
                if (c == '.')
                {
                    state = FRACTIONAL_PART_FIRST_DIGIT;
                    break;
                }
                if (c == 'e' || c == 'E')
                {
                    state = EXPONENT_SIGN_OR_FIRST_DIGIT;
                    break;
                }
                throw lex_error(m_cursor, parse_error::INVALID_NUMBER);

            case FRACTIONAL_PART:
                if (c == 'e' || c == 'E')
                {
                    state = EXPONENT_SIGN_OR_FIRST_DIGIT;
                    break;
                }
                [[fallthrough]];
            case FRACTIONAL_PART_FIRST_DIGIT:
                if (is_digit(c))
                {
                    state = FRACTIONAL_PART;
                    break;
                }
                throw lex_error(m_cursor, parse_error::INVALID_NUMBER);

            case EXPONENT_SIGN_OR_FIRST_DIGIT:
                if (c == '+' || c == '-')
                {
                    state = EXPONENT_FIRST_DIGIT;
                    break;
                }
                [[fallthrough]];
            case EXPONENT_FIRST_DIGIT:
            case EXPONENT:
                if (is_digit(c))
                {
                    state = EXPONENT;
                    break;
                }
                throw lex_error(m_cursor, parse_error::INVALID_NUMBER);
            }

            if (out)
            {
                out->push_back(static_cast<char>(c));
            }

            c = m_cursor.peek();
            if (!is_number_char(c))
            {
                break;
            }
            m_cursor.advance();
        }

        switch (state)
        {
        case AFTER_LEADING_ZERO:
        case INTEGRAL_PART:
        case FRACTIONAL_PART:
        case EXPONENT:
            break;
        default:
            if (c == end_of_input)
            {
                throw truncated_input_error(m_cursor);
            }
            throw lex_error(m_cursor, parse_error::INVALID_NUMBER);
        }

        if (is_alpha(c) || c == '_')
        {
            m_cursor.advance();
            throw lex_error(m_cursor, parse_error::INVALID_NUMBER);
        }
    }

    // Assumes first has already been consumed
    token_type read_literal(const int first)
    {
        // No keyword is longer than this; the rest is kept out of memory
        constexpr std::size_t max_stored = 8;

        std::string bareword(1, static_cast<char>(first));
        while (is_alpha(m_cursor.peek()))
        {
            const int c = m_cursor.advance();
            if (bareword.size() < max_stored)
            {
                bareword.push_back(static_cast<char>(c));
            }
        }

        if (bareword == "true")
        {
            return TRUE_LITERAL;
        }
        if (bareword == "false")
        {
            return FALSE_LITERAL;
        }
        if (bareword == "null")
        {
            return NULL_LITERAL;
        }

        if (m_cursor.peek() == end_of_input)
        {
            for (const std::string_view keyword : {"true", "false", "null"})
            {
                if (keyword.substr(0, bareword.size()) == bareword)
                {
                    throw truncated_input_error(m_cursor);
                }
            }
        }

        throw lex_error(m_cursor, parse_error::INVALID_LITERAL, bareword);
    }

public:

    explicit tokenizer(chunk_source& source) noexcept
    : m_cursor(source)
    {
    }

    std::size_t read_offset() const noexcept
    {
        return m_cursor.read_offset();
    }

    // Reads exactly one token. With keep_payload == false strings and numbers
    // are validated but their content is dropped.
    token next(const bool keep_payload = true)
    {
        token result;

        skip_whitespace();

        const int c = m_cursor.advance();

        switch (c)
        {
        case end_of_input:
            result.type = END_OF_INPUT;
            break;
        case '{':
            result.type = BEGIN_OBJECT;
            break;
        case '}':
            result.type = END_OBJECT;
            break;
        case '[':
            result.type = BEGIN_ARRAY;
            break;
        case ']':
            result.type = END_ARRAY;
            break;
        case ':':
            result.type = NAME_SEPARATOR;
            break;
        case ',':
            result.type = VALUE_SEPARATOR;
            break;
        case '"':
            result.type = STRING;
            read_string(keep_payload ? &result.text : nullptr);
            break;
        case '-':
        case '0':
        case '1':
        case '2':
        case '3':
        case '4':
        case '5':
        case '6':
        case '7':
        case '8':
        case '9':
            result.type = NUMBER;
            read_number(c, keep_payload ? &result.text : nullptr);
            break;
        default:
            if (is_alpha(c))
            {
                result.type = read_literal(c);
                break;
            }
            throw lex_error(
                m_cursor,
                parse_error::UNEXPECTED_CHARACTER,
                std::string(1, static_cast<char>(c)));
        }

        return result;
    }
}; // class tokenizer

class parser; // forward declaration

// Trick to prevent static_assert() from always going off (see as_impl() below)
template<typename>
inline constexpr bool type_dependent_false = false;

} // namespace detail

enum value_type
{
    String,
    Number,
    Boolean,
    Object,
    Array,
    Null
};

inline std::ostream& operator<<(std::ostream& out, const value_type type)
{
    switch (type)
    {
    case String:
        return out << "String";
    case Number:
        return out << "Number";
    case Boolean:
        return out << "Boolean";
    case Object:
        return out << "Object";
    case Array:
        return out << "Array";
    case Null:
        return out << "Null";
    }

    return out << "Unknown"; // LCOV_EXCL_LINE
}

namespace detail
{

template<typename T>
T as_impl(const value_type type, const std::string_view raw_value)
{
    // Here we can assume that type is not Null: that was already checked
    // by as<T> or its partial specialization as<std::optional<T>>

    if (type == Object)
    {
        throw type_mismatch_error(
            "cannot call as<T>() on values of type Object: "
            "use as_object() or operator[] instead");
    }

    if (type == Array)
    {
        throw type_mismatch_error(
            "cannot call as<T>() on values of type Array: "
            "use as_array() or operator[] instead");
    }

    if constexpr (
        std::is_same_v<T, std::string_view> ||
        std::is_same_v<T, std::string>)
    {
        if (type != String)
        {
            throw type_mismatch_error("as<T>(): value type is not String");
        }

        return T(raw_value);
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
        if (type != Boolean)
        {
            throw type_mismatch_error("as<T>(): value type is not Boolean");
        }

        return !raw_value.empty() && raw_value[0] == 't';
    }
    else if constexpr (std::is_arithmetic_v<T>)
    {
        if (type != Number)
        {
            throw type_mismatch_error("as<T>(): value type is not Number");
        }

        T result {}; // value initialize to silence compiler warnings
        const auto begin = raw_value.data();
        const auto end = raw_value.data() + raw_value.size();
        const auto [parse_end, error] = std::from_chars(begin, end, result);
        if (parse_end != end || error != std::errc())
        {
            throw std::range_error("as<T>() could not parse the number");
        }
        return result;
    }
    else // if constexpr
    {
        static_assert(
            type_dependent_false<T>,
            "as<T>(): T is not one of the supported types "
            "(std::string_view, std::string, bool, arithmetic types, plus all "
            "of the above wrapped in std::optional)");
    }
}

template<typename T>
struct as
{
    T operator()(const value_type type, const std::string_view raw_value) const
    {
        if (type == Null)
        {
            throw type_mismatch_error(
                "cannot call as<T>() on values of type Null: "
                "consider checking type() first, or use "
                "as<std::optional<T>>()");
        }

        return as_impl<T>(type, raw_value);
    }
}; // struct as

template<typename T>
struct as<std::optional<T>>
{
    std::optional<T> operator()(
        const value_type type,
        const std::string_view raw_value) const
    {
        if (type == Null)
        {
            return std::nullopt;
        }

        return as_impl<T>(type, raw_value);
    }
}; // struct as<std::optional<T>>

} // namespace detail

// Specialize this to teach value::as<T>() and element::as<T>() about your
// own types
template<typename T, typename Enable = void>
struct value_as
{
    T operator()(const value_type type, const std::string_view raw_value) const
    {
        return detail::as<T>()(type, raw_value);
    }
}; // struct value_as

// Picks up specializations of value_as<T> too
template<typename T>
struct value_as<std::optional<T>>
{
    std::optional<T> operator()(
        const value_type type,
        const std::string_view raw_value) const
    {
        if (type == Null)
        {
            return std::nullopt;
        }

        return value_as<T>()(type, raw_value);
    }
}; // struct value_as<std::optional<T>>

// The built-in conversion, for specializations to fall back on
template<typename T>
T value_as_default(const value_type type, const std::string_view raw_value)
{
    return detail::as<T>()(type, raw_value);
}

class lazy_object; // forward declaration
class lazy_array; // forward declaration
class object_keys; // forward declaration
class element; // forward declaration

// A decoded JSON value. Scalars carry their content; Object and Array values
// are handles onto the shared parser (see as_object() and as_array()).
class value final
{
    friend class detail::parser;

private:

    value_type m_type = Null;
    std::string m_raw_value = "null";
    std::shared_ptr<detail::parser> m_parser;
    std::size_t m_depth = 0;
    std::uint64_t m_serial = 0;

    explicit value(
        std::shared_ptr<detail::parser> parser,
        const value_type type,
        const std::size_t depth,
        const std::uint64_t serial) noexcept
    : m_type(type)
    , m_raw_value()
    , m_parser(std::move(parser))
    , m_depth(depth)
    , m_serial(serial)
    {
    }

public:

    explicit value() = default;

    // Containers built this way are detached from any parser and behave as
    // already exhausted. Null reads back as "null" unless told otherwise.
    explicit value(const value_type type, std::string raw_value = "")
    : m_type(type)
    , m_raw_value(
        (type == Null && raw_value.empty()) ? "null" : std::move(raw_value))
    {
    }

    value_type type() const noexcept
    {
        return m_type;
    }

    // Decoded content for strings, JSON text for numbers, "true"/"false" for
    // booleans, "null" for Null. Empty for containers.
    std::string_view raw() const noexcept
    {
        return m_raw_value;
    }

    template<typename T>
    T as() const
    {
        return value_as<T>()(m_type, m_raw_value);
    }

    lazy_object as_object() const;

    lazy_array as_array() const;

    value operator[](std::string_view key) const;

    value operator[](std::size_t index) const;
}; // class value

namespace detail
{

enum parser_state
{
    EXPECT_VALUE,
    IN_OBJECT_EXPECT_KEY_OR_CLOSE, // in case the object is empty
    IN_OBJECT_EXPECT_KEY,
    IN_OBJECT_EXPECT_COLON,
    IN_OBJECT_EXPECT_VALUE,
    IN_OBJECT_EXPECT_COMMA_OR_CLOSE,
    IN_ARRAY_EXPECT_VALUE_OR_CLOSE, // in case the array is empty
    IN_ARRAY_EXPECT_VALUE,
    IN_ARRAY_EXPECT_COMMA_OR_CLOSE,
    DONE
};

// One open container
struct frame
{
    value_type kind = Object;
    parser_state state = IN_OBJECT_EXPECT_KEY_OR_CLOSE;

    // Distinguishes this container from later ones opened at the same depth
    std::uint64_t serial = 0;

    // Keys read so far (objects) or elements read so far (arrays)
    std::size_t entries = 0;

    // Last key read. Its value is pending while
    // state == IN_OBJECT_EXPECT_COLON.
    std::string key;
};

// The decode session: owns the tokenizer and the stack of open containers.
// Handles (value, lazy_object, lazy_array) identify their container by depth
// and serial; a handle whose frame is gone is exhausted.
class parser : public std::enable_shared_from_this<parser>
{
private:

    tokenizer m_tokenizer;
    std::vector<frame> m_frames;
    parser_state m_root_state = EXPECT_VALUE;
    std::uint64_t m_next_serial = 1;
    std::size_t m_max_nesting_level = 0;

    // The first parse error. The frames may be mid-transition after it, so
    // every later request fails with it again.
    std::optional<parse_error> m_failure;

    template<typename Function>
    auto guarded(Function function) -> decltype(function())
    {
        if (m_failure)
        {
            throw *m_failure;
        }

        try
        {
            return function();
        }
        catch (const parse_error& e)
        {
            m_failure = e;
            throw;
        }
    }

    [[noreturn]] void fail(const token& t, const std::string_view expected) const
    {
        if (t.type == END_OF_INPUT)
        {
            throw truncated_input_error(m_tokenizer);
        }

        throw unexpected_token_error(m_tokenizer, expected, t.type);
    }

    void push_frame(const value_type kind)
    {
        if (m_frames.size() >= LJR_NESTING_LIMIT)
        {
            throw parse_error(m_tokenizer, parse_error::EXCEEDED_NESTING_LIMIT);
        }

        frame f;
        f.kind = kind;
        f.state = (kind == Object)
            ? IN_OBJECT_EXPECT_KEY_OR_CLOSE
            : IN_ARRAY_EXPECT_VALUE_OR_CLOSE;
        f.serial = m_next_serial++;
        m_frames.push_back(std::move(f));

        if (m_frames.size() > m_max_nesting_level)
        {
            m_max_nesting_level = m_frames.size();
        }
    }

    value child_handle(const std::size_t depth)
    {
        const frame& f = m_frames[depth];

        return value(shared_from_this(), f.kind, depth, f.serial);
    }

    value parse_value(token&& t)
    {
        switch (t.type)
        {
        case BEGIN_OBJECT:
            push_frame(Object);
            return child_handle(m_frames.size() - 1);
        case BEGIN_ARRAY:
            push_frame(Array);
            return child_handle(m_frames.size() - 1);
        case STRING:
            return value(String, std::move(t.text));
        case NUMBER:
            return value(Number, std::move(t.text));
        case TRUE_LITERAL:
            return value(Boolean, "true");
        case FALSE_LITERAL:
            return value(Boolean, "false");
        case NULL_LITERAL:
            return value();
        default:
            fail(t, "value");
        }
    }

    void skip_value(token&& t)
    {
        switch (t.type)
        {
        case BEGIN_OBJECT:
            push_frame(Object);
            skip_to_close(m_frames.size() - 1);
            break;
        case BEGIN_ARRAY:
            push_frame(Array);
            skip_to_close(m_frames.size() - 1);
            break;
        case STRING:
        case NUMBER:
        case TRUE_LITERAL:
        case FALSE_LITERAL:
        case NULL_LITERAL:
            break;
        default:
            fail(t, "value");
        }
    }

    // Reads the next key of the object at depth, which must be the innermost
    // open container. Returns false (and closes the frame) at '}'.
    bool read_key(const std::size_t depth)
    {
        if (m_frames[depth].state == IN_OBJECT_EXPECT_COLON)
        {
            // The previous key was handed out without its value
            skip_value(read_member_value_token(depth, false));
        }

        while (true)
        {
            token t = m_tokenizer.next();
            frame& f = m_frames[depth];

            switch (f.state)
            {
            case IN_OBJECT_EXPECT_COMMA_OR_CLOSE:
                if (t.type == VALUE_SEPARATOR)
                {
                    f.state = IN_OBJECT_EXPECT_KEY;
                    continue;
                }
                if (t.type == END_OBJECT)
                {
                    m_frames.pop_back();
                    return false;
                }
                fail(t, "',' or '}'");

            case IN_OBJECT_EXPECT_KEY_OR_CLOSE:
                if (t.type == END_OBJECT)
                {
                    m_frames.pop_back();
                    return false;
                }
                if (t.type != STRING)
                {
                    fail(t, "string or '}'");
                }
                break;

            case IN_OBJECT_EXPECT_KEY:
                if (t.type != STRING)
                {
                    fail(t, "string");
                }
                break;

            // LCOV_EXCL_START
            default:
                throw std::runtime_error(
                    "[lazyjson_reader] this line should never be reached, "
                    "please file a bug report");
            // LCOV_EXCL_STOP
            }

            f.key = std::move(t.text);
            f.state = IN_OBJECT_EXPECT_COLON;
            ++f.entries;

            return true;
        }
    }

    // Consumes the ':' after a key and returns the token starting its value
    token read_member_value_token(
        const std::size_t depth,
        const bool keep_payload)
    {
        token t = m_tokenizer.next();
        if (t.type != NAME_SEPARATOR)
        {
            fail(t, "':'");
        }

        m_frames[depth].state = IN_OBJECT_EXPECT_VALUE;
        t = m_tokenizer.next(keep_payload);
        m_frames[depth].state = IN_OBJECT_EXPECT_COMMA_OR_CLOSE;

        return t;
    }

    // Returns the token starting the next element of the array at depth,
    // which must be the innermost open container. Returns std::nullopt (and
    // closes the frame) at ']'.
    std::optional<token> read_element_token(
        const std::size_t depth,
        const bool keep_payload)
    {
        while (true)
        {
            token t = m_tokenizer.next(keep_payload);
            frame& f = m_frames[depth];

            switch (f.state)
            {
            case IN_ARRAY_EXPECT_COMMA_OR_CLOSE:
                if (t.type == VALUE_SEPARATOR)
                {
                    f.state = IN_ARRAY_EXPECT_VALUE;
                    continue;
                }
                if (t.type == END_ARRAY)
                {
                    m_frames.pop_back();
                    return std::nullopt;
                }
                fail(t, "',' or ']'");

            case IN_ARRAY_EXPECT_VALUE_OR_CLOSE:
                if (t.type == END_ARRAY)
                {
                    m_frames.pop_back();
                    return std::nullopt;
                }
                break;

            case IN_ARRAY_EXPECT_VALUE:
                break;

            // LCOV_EXCL_START
            default:
                throw std::runtime_error(
                    "[lazyjson_reader] this line should never be reached, "
                    "please file a bug report");
            // LCOV_EXCL_STOP
            }

            f.state = IN_ARRAY_EXPECT_COMMA_OR_CLOSE;
            ++f.entries;

            return t;
        }
    }

    // Consumes the innermost container up to and including its closing token
    void skip_to_close(const std::size_t depth)
    {
        if (m_frames[depth].kind == Object)
        {
            while (read_key(depth))
            {
                skip_value(read_member_value_token(depth, false));
            }
        }
        else
        {
            while (std::optional<token> t = read_element_token(depth, false))
            {
                skip_value(std::move(*t));
            }
        }
    }

    // Closes every container nested inside the one at depth
    void unwind(const std::size_t depth)
    {
        while (m_frames.size() > depth + 1)
        {
            skip_to_close(m_frames.size() - 1);
        }
    }

    // Makes the container at depth the innermost one. Returns false if it
    // has already been closed.
    bool enter(const std::size_t depth, const std::uint64_t serial)
    {
        if (!is_open(depth, serial))
        {
            return false;
        }

        unwind(depth);

        return true;
    }

    // The child handed out last by the container at depth, if it is still
    // open
    bool has_open_child(const std::size_t depth) const noexcept
    {
        return m_frames.size() > depth + 1;
    }

public:

    explicit parser(chunk_source& source) noexcept
    : m_tokenizer(source)
    {
    }

    parser(const parser&) = delete;
    parser& operator=(const parser&) = delete;

    std::size_t read_offset() const noexcept
    {
        return m_tokenizer.read_offset();
    }

    std::size_t nesting_level() const noexcept
    {
        return m_frames.size();
    }

    std::size_t max_nesting_level() const noexcept
    {
        return m_max_nesting_level;
    }

    bool is_open(const std::size_t depth, const std::uint64_t serial)
        const noexcept
    {
        return depth < m_frames.size() && m_frames[depth].serial == serial;
    }

    // True if the container has not handed out any entry yet
    bool is_untouched(const std::size_t depth, const std::uint64_t serial)
        const noexcept
    {
        return is_open(depth, serial) && m_frames[depth].entries == 0;
    }

    value read_root()
    {
        return guarded([&]() -> value
        {
            if (m_root_state != EXPECT_VALUE)
            {
                throw stream_exhausted_error(
                    "the root value has already been read");
            }

            m_root_state = DONE;

            token t = m_tokenizer.next();
            if (t.type == END_OF_INPUT)
            {
                throw truncated_input_error(m_tokenizer);
            }

            return parse_value(std::move(t));
        });
    }

    std::optional<std::string> next_key(
        const std::size_t depth,
        const std::uint64_t serial)
    {
        return guarded([&]() -> std::optional<std::string>
        {
            if (!enter(depth, serial) || !read_key(depth))
            {
                return std::nullopt;
            }

            return m_frames[depth].key;
        });
    }

    std::optional<std::pair<std::string, value>> next_member(
        const std::size_t depth,
        const std::uint64_t serial)
    {
        return guarded([&]() -> std::optional<std::pair<std::string, value>>
        {
            if (!enter(depth, serial))
            {
                return std::nullopt;
            }

            // A key handed out by next_key() still has its value pending
            if (m_frames[depth].state != IN_OBJECT_EXPECT_COLON &&
                !read_key(depth))
            {
                return std::nullopt;
            }

            std::string key = m_frames[depth].key;
            value v = parse_value(read_member_value_token(depth, true));

            return std::make_pair(std::move(key), std::move(v));
        });
    }

    std::optional<value> find_member(
        const std::size_t depth,
        const std::uint64_t serial,
        const std::string_view key)
    {
        return guarded([&]() -> std::optional<value>
        {
            if (!is_open(depth, serial))
            {
                return std::nullopt;
            }

            if (has_open_child(depth) &&
                m_frames[depth].state == IN_OBJECT_EXPECT_COMMA_OR_CLOSE &&
                m_frames[depth].key == key)
            {
                return child_handle(depth + 1);
            }

            unwind(depth);

            if (m_frames[depth].state == IN_OBJECT_EXPECT_COLON &&
                m_frames[depth].key == key)
            {
                return parse_value(read_member_value_token(depth, true));
            }

            while (read_key(depth))
            {
                if (m_frames[depth].key == key)
                {
                    return parse_value(read_member_value_token(depth, true));
                }

                skip_value(read_member_value_token(depth, false));
            }

            return std::nullopt;
        });
    }

    std::optional<value> next_element(
        const std::size_t depth,
        const std::uint64_t serial)
    {
        return guarded([&]() -> std::optional<value>
        {
            if (!enter(depth, serial))
            {
                return std::nullopt;
            }

            std::optional<token> t = read_element_token(depth, true);
            if (!t)
            {
                return std::nullopt;
            }

            return parse_value(std::move(*t));
        });
    }

    std::optional<value> find_element(
        const std::size_t depth,
        const std::uint64_t serial,
        const std::size_t index)
    {
        return guarded([&]() -> std::optional<value>
        {
            if (!is_open(depth, serial))
            {
                return std::nullopt;
            }

            if (has_open_child(depth) && m_frames[depth].entries == index + 1)
            {
                return child_handle(depth + 1);
            }

            unwind(depth);

            while (m_frames[depth].entries <= index)
            {
                const bool wanted = m_frames[depth].entries == index;

                std::optional<token> t = read_element_token(depth, wanted);
                if (!t)
                {
                    return std::nullopt;
                }

                if (wanted)
                {
                    return parse_value(std::move(*t));
                }

                skip_value(std::move(*t));
            }

            // Already passed
            return std::nullopt;
        });
    }

    void finish(const std::size_t depth, const std::uint64_t serial)
    {
        guarded([&]
        {
            if (enter(depth, serial))
            {
                skip_to_close(depth);
            }
        });
    }
}; // class parser

template<typename Source, typename Entry>
class entry_iterator
{
private:

    std::optional<Source> m_source;
    std::optional<Entry> m_current;

public:

    using iterator_category = std::input_iterator_tag;
    using value_type = Entry;
    using difference_type = std::ptrdiff_t;
    using pointer = Entry*;
    using reference = Entry&;

    // The end iterator
    entry_iterator() = default;

    explicit entry_iterator(Source source)
    : m_source(std::move(source))
    {
        ++*this;
    }

    reference operator*()
    {
        return *m_current;
    }

    pointer operator->()
    {
        return &*m_current;
    }

    entry_iterator& operator++()
    {
        m_current = m_source->next();
        if (!m_current)
        {
            m_source.reset();
        }

        return *this;
    }

    bool operator==(const entry_iterator& other) const noexcept
    {
        return (!m_current && !other.m_current) || this == &other;
    }

    bool operator!=(const entry_iterator& other) const noexcept
    {
        return !(*this == other);
    }
}; // class entry_iterator

} // namespace detail

// An in-memory JSON value, as produced by lazy_object::materialize() and
// lazy_array::materialize()
class element final
{
private:

    value_type m_type = Null;
    std::string m_raw_value = "null";
    std::vector<std::pair<std::string, element>> m_members;
    std::vector<element> m_items;

    void require(const value_type type, const char* const operation) const
    {
        if (m_type != type)
        {
            throw type_mismatch_error(
                std::string("element::") + operation + ": element type is not "
                + (type == Object ? "Object" : "Array"));
        }
    }

public:

    explicit element() = default;

    explicit element(const value_type type, std::string raw_value = "")
    : m_type(type)
    , m_raw_value(
        (type == Null && raw_value.empty()) ? "null" : std::move(raw_value))
    {
    }

    value_type type() const noexcept
    {
        return m_type;
    }

    std::string_view raw() const noexcept
    {
        return m_raw_value;
    }

    template<typename T>
    T as() const
    {
        return value_as<T>()(m_type, m_raw_value);
    }

    std::size_t size() const
    {
        if (m_type == Object)
        {
            return m_members.size();
        }
        require(Array, "size()");

        return m_items.size();
    }

    bool contains(const std::string_view key) const
    {
        require(Object, "contains()");

        for (const auto& [k, v] : m_members)
        {
            if (k == key)
            {
                return true;
            }
        }

        return false;
    }

    // First member with that key, in document order
    const element& operator[](const std::string_view key) const
    {
        require(Object, "operator[]");

        for (const auto& [k, v] : m_members)
        {
            if (k == key)
            {
                return v;
            }
        }

        throw missing_key_error(key);
    }

    const element& operator[](const std::size_t index) const
    {
        require(Array, "operator[]");

        if (index >= m_items.size())
        {
            throw index_out_of_range_error(index);
        }

        return m_items[index];
    }

    const std::vector<std::pair<std::string, element>>& members() const
    {
        require(Object, "members()");

        return m_members;
    }

    const std::vector<element>& items() const
    {
        require(Array, "items()");

        return m_items;
    }

    void add_member(std::string key, element e)
    {
        require(Object, "add_member()");
        m_members.emplace_back(std::move(key), std::move(e));
    }

    void add_item(element e)
    {
        require(Array, "add_item()");
        m_items.push_back(std::move(e));
    }

    friend bool operator==(const element& lhs, const element& rhs)
    {
        return lhs.m_type == rhs.m_type
            && lhs.m_raw_value == rhs.m_raw_value
            && lhs.m_members == rhs.m_members
            && lhs.m_items == rhs.m_items;
    }

    friend bool operator!=(const element& lhs, const element& rhs)
    {
        return !(lhs == rhs);
    }
}; // class element

// Mapping-like view of an object still being read. Keys become visible in
// document order as the stream advances; anything skipped is gone for good.
class lazy_object final
{
    friend class value;

private:

    std::shared_ptr<detail::parser> m_parser;
    std::size_t m_depth = 0;
    std::uint64_t m_serial = 0;

    explicit lazy_object(
        std::shared_ptr<detail::parser> parser,
        const std::size_t depth,
        const std::uint64_t serial) noexcept
    : m_parser(std::move(parser))
    , m_depth(depth)
    , m_serial(serial)
    {
    }

public:

    using entry = std::pair<std::string, value>;
    using iterator = detail::entry_iterator<lazy_object, entry>;

    bool exhausted() const noexcept
    {
        return !m_parser || !m_parser->is_open(m_depth, m_serial);
    }

    // Next (key, value) pair, or std::nullopt once '}' has been consumed
    std::optional<entry> next()
    {
        if (!m_parser)
        {
            return std::nullopt;
        }

        return m_parser->next_member(m_depth, m_serial);
    }

    // Next key only. Its value stays available to operator[] with that same
    // key until the object is advanced again.
    std::optional<std::string> next_key()
    {
        if (!m_parser)
        {
            return std::nullopt;
        }

        return m_parser->next_key(m_depth, m_serial);
    }

    // Scans forward for key, skipping every entry in between
    value operator[](const std::string_view key)
    {
        std::optional<value> v;
        if (m_parser)
        {
            v = m_parser->find_member(m_depth, m_serial, key);
        }
        if (!v)
        {
            throw missing_key_error(key);
        }

        return std::move(*v);
    }

    iterator begin()
    {
        return iterator(*this);
    }

    iterator end()
    {
        return iterator();
    }

    object_keys keys();

    void finish()
    {
        if (m_parser)
        {
            m_parser->finish(m_depth, m_serial);
        }
    }

    element materialize();
}; // class lazy_object

// Range over the keys of a lazy_object (see lazy_object::next_key())
class object_keys final
{
private:

    lazy_object m_object;

public:

    using iterator = detail::entry_iterator<object_keys, std::string>;

    explicit object_keys(lazy_object object) noexcept
    : m_object(std::move(object))
    {
    }

    std::optional<std::string> next()
    {
        return m_object.next_key();
    }

    iterator begin()
    {
        return iterator(*this);
    }

    iterator end()
    {
        return iterator();
    }
}; // class object_keys

inline object_keys lazy_object::keys()
{
    return object_keys(*this);
}

// Sequence-like view of an array still being read
class lazy_array final
{
    friend class value;

private:

    std::shared_ptr<detail::parser> m_parser;
    std::size_t m_depth = 0;
    std::uint64_t m_serial = 0;

    explicit lazy_array(
        std::shared_ptr<detail::parser> parser,
        const std::size_t depth,
        const std::uint64_t serial) noexcept
    : m_parser(std::move(parser))
    , m_depth(depth)
    , m_serial(serial)
    {
    }

public:

    using iterator = detail::entry_iterator<lazy_array, value>;

    bool exhausted() const noexcept
    {
        return !m_parser || !m_parser->is_open(m_depth, m_serial);
    }

    std::optional<value> next()
    {
        if (!m_parser)
        {
            return std::nullopt;
        }

        return m_parser->next_element(m_depth, m_serial);
    }

    // Scans forward to the element at index, skipping every element in
    // between
    value operator[](const std::size_t index)
    {
        std::optional<value> v;
        if (m_parser)
        {
            v = m_parser->find_element(m_depth, m_serial, index);
        }
        if (!v)
        {
            throw index_out_of_range_error(index);
        }

        return std::move(*v);
    }

    iterator begin()
    {
        return iterator(*this);
    }

    iterator end()
    {
        return iterator();
    }

    void finish()
    {
        if (m_parser)
        {
            m_parser->finish(m_depth, m_serial);
        }
    }

    element materialize();
}; // class lazy_array

inline lazy_object value::as_object() const
{
    if (m_type != Object)
    {
        throw type_mismatch_error(
            "value::as_object(): value type is not Object");
    }

    return lazy_object(m_parser, m_depth, m_serial);
}

inline lazy_array value::as_array() const
{
    if (m_type != Array)
    {
        throw type_mismatch_error(
            "value::as_array(): value type is not Array");
    }

    return lazy_array(m_parser, m_depth, m_serial);
}

inline value value::operator[](const std::string_view key) const
{
    return as_object()[key];
}

inline value value::operator[](const std::size_t index) const
{
    return as_array()[index];
}

namespace detail
{

inline element to_element(const value& v);

inline void check_untouched(
    const std::shared_ptr<parser>& p,
    const std::size_t depth,
    const std::uint64_t serial)
{
    if (!p || !p->is_untouched(depth, serial))
    {
        throw partially_consumed_error(
            "cannot materialize a container that has been partially or "
            "completely consumed");
    }
}

inline element materialize_object(lazy_object object)
{
    element result(Object);

    while (std::optional<lazy_object::entry> member = object.next())
    {
        result.add_member(std::move(member->first), to_element(member->second));
    }

    return result;
}

inline element materialize_array(lazy_array array)
{
    element result(Array);

    while (std::optional<value> item = array.next())
    {
        result.add_item(to_element(*item));
    }

    return result;
}

inline element to_element(const value& v)
{
    switch (v.type())
    {
    case Object:
        return materialize_object(v.as_object());
    case Array:
        return materialize_array(v.as_array());
    default:
        return element(v.type(), std::string(v.raw()));
    }
}

} // namespace detail

inline element lazy_object::materialize()
{
    detail::check_untouched(m_parser, m_depth, m_serial);

    return detail::materialize_object(*this);
}

inline element lazy_array::materialize()
{
    detail::check_untouched(m_parser, m_depth, m_serial);

    return detail::materialize_array(*this);
}

// A decode session over one source. The source is not owned and must outlive
// every value read from it.
class reader final
{
private:

    std::shared_ptr<detail::parser> m_parser;

public:

    explicit reader(chunk_source& source)
    : m_parser(std::make_shared<detail::parser>(source))
    {
    }

    // Returns the root value. Can be called only once.
    value read()
    {
        return m_parser->read_root();
    }

    std::size_t read_offset() const noexcept
    {
        return m_parser->read_offset();
    }

    // Number of containers currently open
    std::size_t nesting_level() const noexcept
    {
        return m_parser->nesting_level();
    }

    std::size_t max_nesting_level() const noexcept
    {
        return m_parser->max_nesting_level();
    }
}; // class reader

inline value load(chunk_source& source)
{
    reader r(source);

    return r.read();
}

} // namespace lazyjson

#endif // LAZYJSON_READER_H

#undef LJR_STRINGIFY
#undef LJR_STRINGIFY_HELPER
