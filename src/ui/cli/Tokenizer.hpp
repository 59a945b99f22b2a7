#ifndef KEYWARD_UI_CLI_TOKENIZER_HPP
#define KEYWARD_UI_CLI_TOKENIZER_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::ui::cli
{

class TokenizeError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Shell-style word splitting for one command line.
//
// Single quotes are literal. Double quotes honour \" \\ \$ and \`. Outside quotes a backslash
// escapes the next character and an unquoted '#' at the start of a word comments out the rest of
// the line. Adjacent quoted and bare pieces join into one word ('a'"b"c is "abc").
//
// Throws TokenizeError for a quote that is never closed.
class Tokenizer
{
public:
    [[nodiscard]] static std::vector<std::string> tokenize(std::string_view line);

private:
    enum class Quote
    {
        None,
        Single,
        Double
    };

    explicit Tokenizer(std::string_view line) : m_line(line)
    {
    }

    void run();
    void endWord();
    void bare(char c);
    void inSingle(char c);
    void inDouble(char c);

    [[nodiscard]] bool hasNext() const
    {
        return m_pos + 1 < m_line.size();
    }

    std::string_view m_line;
    std::size_t m_pos{ 0 };
    Quote m_quote{ Quote::None };
    bool m_inWord{ false };
    bool m_comment{ false };
    std::string m_word;
    std::vector<std::string> m_words;
};

} // namespace keyward::ui::cli

#endif // KEYWARD_UI_CLI_TOKENIZER_HPP
