#include <modeldiff/utilities/text.h>

namespace modeldiff {

// Continuation bytes in UTF-8 have the form 10xxxxxx.
static bool
is_continuation_byte(char c)
{
    return (static_cast<unsigned char>(c) & 0xc0) == 0x80;
}

string
utf8_prefix(string const& text, size_t length)
{
    size_t characters = 0;
    for (size_t i = 0; i != text.length(); ++i)
    {
        if (!is_continuation_byte(text[i]))
        {
            if (characters == length)
                return text.substr(0, i);
            ++characters;
        }
    }
    return text;
}

size_t
utf8_length(string const& text)
{
    size_t characters = 0;
    for (char c : text)
    {
        if (!is_continuation_byte(c))
            ++characters;
    }
    return characters;
}

} // namespace modeldiff
