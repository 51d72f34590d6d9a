#pragma once

#include "logger.hh"
#include "error.hh"

#define EXPECT(e, ...)                                                         \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw std::runtime_error(__err);                                   \
        }                                                                      \
    } while (0)
#define CHECK(e) EXPECT(e, "Expression evaluated as false:\n\t", #e)

/// Check that a==b
/// example: `ASSERT_EQ(int,42,meaning_of_life())`
#define EXPECT_EQ(T, a, b)                                                     \
    do {                                                                       \
        T a_ = (T)(a);                                                         \
        T b_ = (T)(b);                                                         \
        EXPECT(                                                                \
          a_ == b_, "Expected ", #a, " == ", #b, " but ", a_, " != ", b_);     \
    } while (0)

#define EXPECT_STR_EQ(a, b)                                                    \
    do {                                                                       \
        std::string a_ = (a) ? (a) : "";                                       \
        std::string b_ = (b) ? (b) : "";                                       \
        EXPECT(a_ == b_,                                                       \
               "Expected ",                                                    \
               #a,                                                             \
               " == ",                                                         \
               #b,                                                             \
               " but ",                                                        \
               a_,                                                             \
               " != ",                                                         \
               b_);                                                            \
    } while (0)

/// Check that evaluating `expr` throws an xzarrguard::Error with `status`
#define EXPECT_THROWS_STATUS(expr, status)                                     \
    do {                                                                       \
        bool thrown_ = false;                                                  \
        try {                                                                  \
            (void)(expr);                                                      \
        } catch (const xzarrguard::Error& e_) {                                \
            thrown_ = true;                                                    \
            EXPECT(e_.code() == (status),                                      \
                   "Expected ",                                                \
                   #expr,                                                      \
                   " to fail with ",                                           \
                   xzarrguard::status_code_name(status),                       \
                   " but got ",                                                \
                   xzarrguard::status_code_name(e_.code()));                   \
        }                                                                      \
        EXPECT(thrown_, "Expected ", #expr, " to throw");                      \
    } while (0)
