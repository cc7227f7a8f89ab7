#include "datasentry/text/sentiment_lexicon.hpp"

#include <stdexcept>

namespace datasentry::text {

SentimentLexicon::SentimentLexicon(std::unordered_set<std::string> positive, std::unordered_set<std::string> negative,
                                   std::unordered_set<std::string> negators)
    : positive_(std::move(positive)), negative_(std::move(negative)), negators_(std::move(negators)) {
	for (const auto &word : positive_) {
		if (negative_.count(word) > 0) {
			throw std::invalid_argument("Term '" + word + "' cannot be both positive and negative.");
		}
	}
}

const std::unordered_set<std::string> &SentimentLexicon::defaultNegators() {
	static const std::unordered_set<std::string> negators{"not", "no", "never", "without", "hardly", "nor"};
	return negators;
}

const SentimentLexicon &SentimentLexicon::standard() {
	static const SentimentLexicon lexicon(
	    {"good",      "great",     "excellent", "improved", "improve",   "improvement", "positive", "success",
	     "successful", "satisfied", "helpful",  "efficient", "effective", "resolved",   "growth",   "gain",
	     "gains",     "benefit",   "benefits",  "strong",   "stable",    "happy",       "pleased",  "praise",
	     "commend",   "excellence", "approved", "achieve",  "achieved",  "progress",    "support",  "safe",
	     "reliable",  "timely",    "clear",     "welcome",  "recommend", "better",      "best",     "thank"},
	    {"bad",       "poor",      "failure",  "failed",    "fail",      "complaint",   "complaints", "negative",
	     "delay",     "delays",    "delayed",  "problem",   "problems",  "issue",       "issues",     "broken",
	     "unsafe",    "decline",   "declined", "loss",      "losses",    "weak",        "unhappy",    "angry",
	     "dissatisfied", "fraud",  "error",    "errors",    "risk",      "violation",   "breach",     "shortage",
	     "cut",       "cuts",      "worse",    "worst",     "unacceptable", "concern",  "concerns",   "crisis"});
	return lexicon;
}

Sentiment SentimentLexicon::classify(const std::vector<std::string> &tokens) const {
	int balance = 0;
	for (std::size_t i = 0; i < tokens.size(); ++i) {
		int polarity = 0;
		if (positive_.count(tokens[i]) > 0) {
			polarity = 1;
		} else if (negative_.count(tokens[i]) > 0) {
			polarity = -1;
		}
		if (polarity != 0 && i > 0 && isNegator(tokens[i - 1])) {
			polarity = -polarity;
		}
		balance += polarity;
	}
	if (balance > 0) {
		return Sentiment::Positive;
	}
	if (balance < 0) {
		return Sentiment::Negative;
	}
	return Sentiment::Neutral;
}

std::string toString(Sentiment sentiment) {
	switch (sentiment) {
	case Sentiment::Positive:
		return "positive";
	case Sentiment::Neutral:
		return "neutral";
	case Sentiment::Negative:
		return "negative";
	}
	return "neutral";
}

} // namespace datasentry::text
