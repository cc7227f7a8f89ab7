#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

namespace datasentry::text {

/**
 * @class Tokenizer
 * @brief Lower-cases text and splits it into alphanumeric terms.
 *
 * Terms shorter than `min_length` and stop words are dropped. Negators are
 * never stop words because sentiment scoring depends on them.
 */
class Tokenizer {
public:
	explicit Tokenizer(std::unordered_set<std::string> stop_words = defaultStopWords(), std::size_t min_length = 2);

	std::vector<std::string> tokenize(const std::string &text) const;

	/// Lower-cased, trimmed form of a caller-supplied keyword; may contain spaces.
	static std::string normalizeKeyword(const std::string &keyword);

	static const std::unordered_set<std::string> &defaultStopWords();

private:
	std::unordered_set<std::string> stop_words_;
	std::size_t min_length_;
};

} // namespace datasentry::text
