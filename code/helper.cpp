
#include "helper.h"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;


double mean_of(const vector<double>& values) {
    if (values.size() == 0)
        return 0.0;
    double sum = 0.0;
    for (double v : values)
        sum += v;
    return sum / (double) values.size();
}


bool normalize_by_mean(const vector<double>& values, vector<double>& normalized) {
    const double mean = mean_of(values);
    if (!(mean > 0.0))
        return false;
    normalized.resize(values.size());
    for (size_t i = 0; i < values.size(); i++)
        normalized[i] = values[i] / mean;
    return true;
}


vector<double> slice_series(const vector<double>& values, size_t begin, size_t length) {
    if (begin + length > values.size())
        throw out_of_range("slice_series(): Range exceeds the length of the series.");
    return vector<double>(values.begin() + (long) begin, values.begin() + (long) (begin + length));
}


string join_values(const vector<double>& values, const string& sep) {
    stringstream ss;
    bool first = true;
    for (double v : values) {
        if (!first) ss << sep;
        ss << v;
        first = false;
    }
    return ss.str();
}

