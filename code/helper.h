/*
 * helper.h
 *
 * This file contains functions that can be used everywhere
 * in the program.
 * They might make things more easy.
 */

#ifndef __HELPER_H_
#define __HELPER_H_

#include <string>
#include <vector>

using namespace std;


/**
 * Returns the arithmetic mean of the values, or 0 for an empty vector
 */
double mean_of(const vector<double>& values);

/**
 * Divides all values by their mean and stores the result in normalized.
 * Returns false, if the mean is not positive (normalized is left untouched then).
 */
bool normalize_by_mean(const vector<double>& values, vector<double>& normalized);

/**
 * Returns the values [begin, begin + length) of a vector.
 * The range must be inside of the vector.
 */
vector<double> slice_series(const vector<double>& values, size_t begin, size_t length);

/**
 * Joins the values to a string separated by sep, e.g. "1,1,2.5"
 */
string join_values(const vector<double>& values, const string& sep = ",");


#endif
