#pragma once
#include "types.hpp"
#include <random>
#include <string>
#include <vector>

namespace scribe {

// Pads [len x 3] stroke sequences into a time-major batch. A zero point is
// prepended to every sequence; inputs[t] is point t-1 and targets[t] is point t.
StrokeBatch pad_strokes(const std::vector<Mat>& strokes);

// Pads [len x n_char] one-hot sequences with zero rows to a common length
CharBatch pad_chars(const std::vector<Mat>& one_hot);

// Maps text to one-hot rows. Index 0 is reserved for characters outside the
// alphabet, so n_char() == alphabet size + 1.
class OneHotEncoder {
public:
    static const char* default_alphabet();

    explicit OneHotEncoder(const std::string& alphabet = default_alphabet());

    Mat encode(const std::string& text) const;
    std::vector<Mat> encode(const std::vector<std::string>& texts) const;

    int index_of(char ch) const;
    int n_char() const { return static_cast<int>(alphabet_.size()) + 1; }

private:
    std::string alphabet_;
    std::vector<int> lookup_;
};

// Synthetic data for demos and tests
class DataGenerator {
public:
    explicit DataGenerator(unsigned seed = 123) : gen_(seed) {}

    // Cursive-like loops: [len x 3] offsets with a pen lift every few points
    std::vector<Mat> generate_strokes(int count, int min_len, int max_len);

    std::vector<std::string> generate_sentences(int count, int min_len, int max_len,
                                                const std::string& alphabet);

private:
    std::mt19937 gen_;
    std::normal_distribution<double> normal_{0.0, 1.0};
};

// Write generated points as CSV rows: sample,step,lift,dx,dy
void save_strokes_csv(const Seq& samples, const std::string& filename);

} // namespace scribe
