#include "Tokenizer.hpp"

#include <cctype>

namespace keyward::ui::cli
{

std::vector<std::string> Tokenizer::tokenize(std::string_view line)
{
    Tokenizer t{ line };
    t.run();
    return std::move(t.m_words);
}

void Tokenizer::run()
{
    while (m_pos < m_line.size() && !m_comment)
    {
        const char c{ m_line[m_pos] };
        switch (m_quote)
        {
        case Quote::None:
            bare(c);
            break;
        case Quote::Single:
            inSingle(c);
            break;
        case Quote::Double:
            inDouble(c);
            break;
        }
    }

    if (m_quote != Quote::None)
    {
        throw TokenizeError{ m_quote == Quote::Single ? "unterminated single quote" : "unterminated double quote" };
    }
    endWord();
}

void Tokenizer::endWord()
{
    if (m_inWord)
    {
        m_words.push_back(std::move(m_word));
    }
    m_word.clear();
    m_inWord = false;
}

void Tokenizer::bare(char c)
{
    if (std::isspace(static_cast<unsigned char>(c)) != 0)
    {
        endWord();
        ++m_pos;
        return;
    }
    if (c == '#' && !m_inWord)
    {
        m_comment = true;
        return;
    }

    m_inWord = true;
    if (c == '\'')
    {
        m_quote = Quote::Single;
    }
    else if (c == '"')
    {
        m_quote = Quote::Double;
    }
    else if (c == '\\' && hasNext())
    {
        m_word.push_back(m_line[++m_pos]);
    }
    else
    {
        m_word.push_back(c);
    }
    ++m_pos;
}

void Tokenizer::inSingle(char c)
{
    if (c == '\'')
    {
        m_quote = Quote::None;
    }
    else
    {
        m_word.push_back(c);
    }
    ++m_pos;
}

void Tokenizer::inDouble(char c)
{
    if (c == '"')
    {
        m_quote = Quote::None;
        ++m_pos;
        return;
    }
    if (c == '\\' && hasNext())
    {
        const char next{ m_line[m_pos + 1] };
        if (next == '"' || next == '\\' || next == '$' || next == '`')
        {
            m_word.push_back(next);
            m_pos += 2;
            return;
        }
    }
    m_word.push_back(c);
    ++m_pos;
}

} // namespace keyward::ui::cli
