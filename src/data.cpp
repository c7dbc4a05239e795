#include "scribe/data.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace scribe {

StrokeBatch pad_strokes(const std::vector<Mat>& strokes) {
    if (strokes.empty()) {
        throw std::invalid_argument("pad_strokes: no strokes given");
    }

    int T = 0;
    for (size_t b = 0; b < strokes.size(); ++b) {
        if (strokes[b].cols() != 3 || strokes[b].rows() == 0) {
            throw std::invalid_argument("pad_strokes: stroke " + std::to_string(b) +
                                        " must be a non-empty [len x 3] matrix");
        }
        T = std::max(T, static_cast<int>(strokes[b].rows()));
    }

    const int B = static_cast<int>(strokes.size());
    StrokeBatch batch;
    batch.inputs.assign(T, Mat::Zero(3, B));
    batch.targets.assign(T, Mat::Zero(3, B));
    batch.mask = Mat::Zero(T, B);

    for (int b = 0; b < B; ++b) {
        const Mat& s = strokes[b];
        const int len = static_cast<int>(s.rows());
        for (int t = 0; t < len; ++t) {
            batch.targets[t].col(b) = s.row(t).transpose();
            if (t + 1 < T) batch.inputs[t + 1].col(b) = s.row(t).transpose();
            batch.mask(t, b) = 1.0;
        }
    }
    return batch;
}

CharBatch pad_chars(const std::vector<Mat>& one_hot) {
    if (one_hot.empty()) {
        throw std::invalid_argument("pad_chars: no sequences given");
    }

    const int n_char = static_cast<int>(one_hot[0].cols());
    int U = 0;
    for (size_t b = 0; b < one_hot.size(); ++b) {
        if (one_hot[b].cols() != n_char) {
            throw std::invalid_argument("pad_chars: sequence " + std::to_string(b) + " has width " +
                                        std::to_string(one_hot[b].cols()) + ", expected " +
                                        std::to_string(n_char));
        }
        U = std::max(U, static_cast<int>(one_hot[b].rows()));
    }
    if (U == 0) {
        throw std::invalid_argument("pad_chars: all sequences are empty");
    }

    CharBatch batch;
    for (const auto& seq : one_hot) {
        Mat padded = Mat::Zero(U, n_char);
        padded.topRows(seq.rows()) = seq;
        batch.chars.push_back(padded);
        batch.lengths.push_back(static_cast<int>(seq.rows()));
    }
    return batch;
}

const char* OneHotEncoder::default_alphabet() {
    return " abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ.,'";
}

OneHotEncoder::OneHotEncoder(const std::string& alphabet)
    : alphabet_(alphabet), lookup_(256, 0) {
    for (size_t i = 0; i < alphabet_.size(); ++i) {
        lookup_[static_cast<unsigned char>(alphabet_[i])] = static_cast<int>(i) + 1;
    }
}

int OneHotEncoder::index_of(char ch) const {
    return lookup_[static_cast<unsigned char>(ch)];
}

Mat OneHotEncoder::encode(const std::string& text) const {
    Mat out = Mat::Zero(text.size(), n_char());
    for (size_t u = 0; u < text.size(); ++u) {
        out(u, index_of(text[u])) = 1.0;
    }
    return out;
}

std::vector<Mat> OneHotEncoder::encode(const std::vector<std::string>& texts) const {
    std::vector<Mat> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        out.push_back(encode(text));
    }
    return out;
}

std::vector<Mat> DataGenerator::generate_strokes(int count, int min_len, int max_len) {
    std::uniform_int_distribution<int> len_dist(min_len, max_len);
    std::uniform_int_distribution<int> lift_every(6, 12);
    std::uniform_real_distribution<double> radius_dist(0.5, 1.5);

    std::vector<Mat> strokes;
    strokes.reserve(count);
    for (int n = 0; n < count; ++n) {
        const int len = len_dist(gen_);
        const int period = lift_every(gen_);
        const double radius = radius_dist(gen_);

        Mat s(len, 3);
        for (int t = 0; t < len; ++t) {
            // Loops drifting to the right, like cursive 'e's
            double angle = 2.0 * M_PI * (t % period) / period;
            s(t, 0) = ((t + 1) % period == 0) ? 1.0 : 0.0;
            s(t, 1) = 0.3 - radius * std::sin(angle) * 0.6 + 0.05 * normal_(gen_);
            s(t, 2) = radius * std::cos(angle) * 0.6 + 0.05 * normal_(gen_);
        }
        strokes.push_back(s);
    }
    return strokes;
}

std::vector<std::string> DataGenerator::generate_sentences(int count, int min_len, int max_len,
                                                           const std::string& alphabet) {
    std::uniform_int_distribution<int> len_dist(min_len, max_len);
    std::uniform_int_distribution<size_t> char_dist(0, alphabet.size() - 1);

    std::vector<std::string> sentences;
    sentences.reserve(count);
    for (int n = 0; n < count; ++n) {
        std::string s(len_dist(gen_), ' ');
        for (auto& ch : s) ch = alphabet[char_dist(gen_)];
        sentences.push_back(s);
    }
    return sentences;
}

void save_strokes_csv(const Seq& samples, const std::string& filename) {
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    file << "sample,step,lift,dx,dy\n";
    if (samples.empty()) return;

    const int B = samples[0].cols();
    for (int b = 0; b < B; ++b) {
        for (size_t t = 0; t < samples.size(); ++t) {
            file << b << "," << t << "," << samples[t](0, b) << ","
                 << samples[t](1, b) << "," << samples[t](2, b) << "\n";
        }
    }
}

} // namespace scribe
