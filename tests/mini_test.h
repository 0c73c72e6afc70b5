#pragma once
#include <cstdio>
#include <cstdlib>
#include <cmath>
#include <cstring>
#include <exception>

// Each CHECK_* returns 1 from the enclosing function on failure, so test
// cases are functions returning int and main() chains them with RUN_CASE.

#define TEST_FAIL(...) do { std::fprintf(stderr, __VA_ARGS__); std::fprintf(stderr, "\n"); return 1; } while (0)

#define CHECK_TRUE(cond) do { \
  if (!(cond)) { \
    TEST_FAIL("%s:%d: CHECK_TRUE failed: %s", __FILE__, __LINE__, #cond); \
  } \
} while (0)

#define CHECK_EQ(a, b) do { \
  auto _va = (a); \
  auto _vb = (b); \
  if (!(_va == _vb)) { \
    std::fprintf(stderr, "%s:%d: CHECK_EQ failed: %s == %s (got %lld vs %lld)\n", __FILE__, __LINE__, #a, #b, \
      (long long)_va, (long long)_vb); \
    return 1; \
  } \
} while (0)

#define CHECK_NEAR(a, b, eps) do { \
  double _da = (double)(a); \
  double _db = (double)(b); \
  double _de = (double)(eps); \
  if (std::fabs(_da - _db) > _de) { \
    std::fprintf(stderr, "%s:%d: CHECK_NEAR failed: |%s - %s| <= %s (got %.9g vs %.9g, diff=%.9g)\n", __FILE__, __LINE__, \
      #a, #b, #eps, _da, _db, std::fabs(_da - _db)); \
    return 1; \
  } \
} while (0)

// Passes only if expr throws ex_type (or a subclass); the caught
// exception is bound to `ex` inside on_catch.
#define CHECK_THROWS_AS(expr, ex_type, on_catch) do { \
  bool _thrown = false; \
  try { \
    (void)(expr); \
  } catch (const ex_type& ex) { \
    _thrown = true; \
    on_catch; \
  } catch (const std::exception& _other) { \
    TEST_FAIL("%s:%d: %s threw the wrong exception type: %s", __FILE__, __LINE__, #expr, _other.what()); \
  } \
  if (!_thrown) { \
    TEST_FAIL("%s:%d: %s did not throw %s", __FILE__, __LINE__, #expr, #ex_type); \
  } \
} while (0)

#define SKIP_IF(cond, msg) do { \
  if (cond) { \
    std::fprintf(stderr, "%s:%d: SKIP: %s\n", __FILE__, __LINE__, msg); \
    return 0; \
  } \
} while (0)

#define RUN_CASE(fn) do { \
  if ((fn)() != 0) { \
    std::fprintf(stderr, "case %s failed\n", #fn); \
    return 1; \
  } \
} while (0)
