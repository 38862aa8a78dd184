#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

#include "cosmos/util/strings.h"

#define COSMOS_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_strings() {
  using namespace cosmos;

  COSMOS_ASSERT(to_lower("WatchList") == "watchlist");
  COSMOS_ASSERT(trim_copy("  dev \t\n") == "dev");
  COSMOS_ASSERT(trim_copy(" \t ").empty());

  COSMOS_ASSERT(is_uuid("9d49907c-a057-4f3b-9cfc-a6e2769b44cd"));
  COSMOS_ASSERT(is_uuid("9D49907C-A057-4F3B-9CFC-A6E2769B44CD"));
  COSMOS_ASSERT(!is_uuid("9d49907ca0574f3b9cfca6e2769b44cd"));
  COSMOS_ASSERT(!is_uuid("profile-42"));

  std::int64_t v = -1;
  COSMOS_ASSERT(parse_decimal_int64("1001", v));
  COSMOS_ASSERT(v == 1001);
  COSMOS_ASSERT(parse_decimal_int64("0", v));
  COSMOS_ASSERT(v == 0);
  COSMOS_ASSERT(parse_decimal_int64("9223372036854775807", v));
  COSMOS_ASSERT(v == std::numeric_limits<std::int64_t>::max());

  // Rejected input leaves the output untouched.
  v = 17;
  COSMOS_ASSERT(!parse_decimal_int64("9223372036854775808", v));
  COSMOS_ASSERT(!parse_decimal_int64("123456789012345678901234567890", v));
  COSMOS_ASSERT(!parse_decimal_int64("", v));
  COSMOS_ASSERT(!parse_decimal_int64("-5", v));
  COSMOS_ASSERT(!parse_decimal_int64("+5", v));
  COSMOS_ASSERT(!parse_decimal_int64(" 5", v));
  COSMOS_ASSERT(!parse_decimal_int64("5x", v));
  COSMOS_ASSERT(v == 17);

  return 0;
}
