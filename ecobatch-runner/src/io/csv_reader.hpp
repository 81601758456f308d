#ifndef ECOBATCH_RUNNER_CSV_READER_HPP
#define ECOBATCH_RUNNER_CSV_READER_HPP

#include <istream>
#include <string>
#include <vector>

namespace ecobatch {

/**
 * @brief Line-oriented CSV reader
 *
 * Cells are trimmed. A cell may be wrapped in double quotes to carry the
 * delimiter; a doubled quote inside a quoted cell is a literal quote.
 * Quoted cells cannot span lines.
 */
class CsvReader {
public:
    explicit CsvReader(std::istream& is, char delimiter = ',');

    /**
     * @brief Next non-empty row, or an empty vector at end of input
     */
    std::vector<std::string> read_row();

    size_t line_number() const { return line_number_; }

private:
    std::istream& is_;
    char delimiter_;
    size_t line_number_;

    std::vector<std::string> split(const std::string& line) const;
    static std::string trim(const std::string& s);
};

} // namespace ecobatch

#endif // ECOBATCH_RUNNER_CSV_READER_HPP
