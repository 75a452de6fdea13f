// pbrt is Copyright(c) 1998-2020 Matt Pharr, Wenzel Jakob, and Greg Humphreys.
// It is licensed under the BSD license; see the file LICENSE.txt
// SPDX: BSD-3-Clause

#include <tfilm/util/print.h>

#include <tfilm/util/check.h>

#include <double-conversion/double-conversion.h>

namespace tfilm {
namespace detail {

static const double_conversion::DoubleToStringConverter &floatConverter() {
    // Shortest representation that round-trips; switch to exponential
    // notation only for very small or large values.
    static const double_conversion::DoubleToStringConverter converter(
        double_conversion::DoubleToStringConverter::NO_FLAGS, "Infinity", "NaN", 'e',
        -6 /* decimal_in_shortest_low */, 21 /* decimal_in_shortest_high */,
        0 /* max_leading_padding_zeroes_in_precision_mode */,
        0 /* max_trailing_padding_zeroes_in_precision_mode */);
    return converter;
}

std::string FloatToString(float v) {
    char buf[64];
    double_conversion::StringBuilder builder(buf, sizeof(buf));
    floatConverter().ToShortestSingle(v, &builder);
    return builder.Finalize();
}

std::string DoubleToString(double v) {
    char buf[64];
    double_conversion::StringBuilder builder(buf, sizeof(buf));
    floatConverter().ToShortest(v, &builder);
    return builder.Finalize();
}

void stringPrintfRecursive(std::string *s, const char *fmt) {
    const char *c = fmt;
    // No args left; make sure there aren't any extra formatting
    // specifiers.
    while (*c) {
        if (*c == '%') {
            CHECK_EQ(c[1], '%');
            ++c;
        }
        *s += *c++;
    }
}

std::string copyToFormatString(const char **fmt_ptr, std::string *s) {
    const char *&fmt = *fmt_ptr;
    while (*fmt) {
        if (*fmt != '%') {
            *s += *fmt;
            ++fmt;
        } else if (fmt[1] == '%') {
            // "%%"; let it pass through
            *s += '%';
            fmt += 2;
        } else
            // fmt is at the start of a formatting directive.
            break;
    }

    std::string nextFmt;
    if (*fmt) {
        do {
            nextFmt += *fmt;
            ++fmt;
            // Incomplete (but good enough?) test for the end of the
            // formatting directive: a new formatting directive starts, we
            // hit whitespace, or we hit a comma.
        } while (*fmt && *fmt != '%' && !isspace(*fmt) && *fmt != ',' && *fmt != '[' &&
                 *fmt != ']' && *fmt != '(' && *fmt != ')');
    }

    return nextFmt;
}

}  // namespace detail
}  // namespace tfilm
