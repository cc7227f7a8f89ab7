#pragma once

#include <string>
#include <unordered_set>
#include <vector>

namespace datasentry::text {

enum class Sentiment {
	Positive,
	Neutral,
	Negative
};

/**
 * @class SentimentLexicon
 * @brief Word-list sentiment for one tokenized document.
 *
 * A document is positive when it holds more positive than negative terms,
 * negative in the opposite case and neutral otherwise. A negator directly
 * before a sentiment term flips that term.
 */
class SentimentLexicon {
public:
	SentimentLexicon(std::unordered_set<std::string> positive, std::unordered_set<std::string> negative,
	                 std::unordered_set<std::string> negators = defaultNegators());

	/// General-purpose lexicon for institutional feedback and reports.
	static const SentimentLexicon &standard();
	static const std::unordered_set<std::string> &defaultNegators();

	Sentiment classify(const std::vector<std::string> &tokens) const;

	bool isNegator(const std::string &token) const {
		return negators_.count(token) > 0;
	}

private:
	std::unordered_set<std::string> positive_;
	std::unordered_set<std::string> negative_;
	std::unordered_set<std::string> negators_;
};

std::string toString(Sentiment sentiment);

} // namespace datasentry::text
