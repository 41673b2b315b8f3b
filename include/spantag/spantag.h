#ifndef SPANTAG_SPANTAG_H
#define SPANTAG_SPANTAG_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum spantag_status {
  SPANTAG_OK = 0,
  SPANTAG_ERR_INVALID_ARGUMENT = 1,
  SPANTAG_ERR_UNKNOWN_SCHEME = 2,
  SPANTAG_ERR_MALFORMED_TAG = 3,
  SPANTAG_ERR_INVALID_TRANSITION = 4,
  SPANTAG_ERR_OVERLAP = 5,
  SPANTAG_ERR_OUT_OF_RANGE = 6,
  SPANTAG_ERR_BACKEND = 7
} spantag_status;

typedef enum spantag_scheme {
  SPANTAG_SCHEME_IOB = 0,
  SPANTAG_SCHEME_BIO = 1,
  SPANTAG_SCHEME_IOBES = 2,
  SPANTAG_SCHEME_BILOU = 3,
  SPANTAG_SCHEME_BMEWO = 4
} spantag_scheme;

typedef enum spantag_policy {
  SPANTAG_POLICY_STRICT = 0,
  SPANTAG_POLICY_COERCE = 1,
  SPANTAG_POLICY_KEEP_GOING = 2
} spantag_policy;

// Marker separating the role prefix from the entity type, e.g. "B-PER".
#define SPANTAG_TAG_SEPARATOR '-'
#define SPANTAG_OUTSIDE_MARKER 'O'
#define SPANTAG_SCHEME_COUNT 5u

#ifdef __cplusplus
}
#endif

#endif  // SPANTAG_SPANTAG_H
