#include "datasentry/text/tokenizer.hpp"

#include <cctype>
#include <stdexcept>

namespace datasentry::text {

Tokenizer::Tokenizer(std::unordered_set<std::string> stop_words, std::size_t min_length)
    : stop_words_(std::move(stop_words)), min_length_(min_length) {
	if (min_length_ == 0) {
		throw std::invalid_argument("Minimum token length must be positive.");
	}
}

std::vector<std::string> Tokenizer::tokenize(const std::string &text) const {
	std::vector<std::string> tokens;
	std::string current;
	auto flush = [&]() {
		if (current.size() >= min_length_ && stop_words_.find(current) == stop_words_.end()) {
			tokens.push_back(current);
		}
		current.clear();
	};
	for (unsigned char c : text) {
		if (std::isalnum(c)) {
			current.push_back(static_cast<char>(std::tolower(c)));
		} else {
			flush();
		}
	}
	flush();
	return tokens;
}

std::string Tokenizer::normalizeKeyword(const std::string &keyword) {
	std::size_t begin = 0;
	std::size_t end = keyword.size();
	while (begin < end && std::isspace(static_cast<unsigned char>(keyword[begin]))) {
		++begin;
	}
	while (end > begin && std::isspace(static_cast<unsigned char>(keyword[end - 1]))) {
		--end;
	}
	std::string normalized;
	normalized.reserve(end - begin);
	for (std::size_t i = begin; i < end; ++i) {
		normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(keyword[i]))));
	}
	return normalized;
}

const std::unordered_set<std::string> &Tokenizer::defaultStopWords() {
	static const std::unordered_set<std::string> words{
	    "a",     "an",    "and",   "are",  "as",    "at",    "be",    "been",  "but",   "by",   "for",
	    "from",  "had",   "has",   "have", "he",    "her",   "his",   "if",    "in",    "into", "is",
	    "it",    "its",   "of",    "on",   "or",    "our",   "she",   "so",    "that",  "the",  "their",
	    "them",  "then",  "there", "these", "they", "this",  "those", "to",    "was",   "we",   "were",
	    "what",  "when",  "which", "while", "who",  "will",  "with",  "would", "you",   "your", "also",
	    "about", "after", "all",   "any",  "can",   "do",    "does",  "did",   "more",  "most", "other",
	    "some",  "such",  "than",  "too",  "very",  "just",  "over",  "only",  "own",   "same", "each"};
	return words;
}

} // namespace datasentry::text
