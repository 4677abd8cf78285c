// uplimit Umbrella Header
//
// Include this single header to pull in the public API of the request body limit:
//   - Configuration (UploadLimitConfig, LimitPolicy) and the PayloadTooLarge error
//   - The bounded body reader and the body source abstraction it wraps
//   - The UploadLimit middleware and the request pipeline hosting it
//   - Request / Response primitives and HTTP constants
//
// Each re-exported header line is annotated with IWYU pragma: export so that symbols they provide are treated as
// satisfied for direct use in user code. Include the specific headers instead to minimize compile time.
#pragma once

// IWYU pragma: begin_exports
#include "uplimit/body-source.hpp"
#include "uplimit/bounded-body-reader.hpp"
#include "uplimit/declared-length.hpp"
#include "uplimit/http-constants.hpp"
#include "uplimit/http-method.hpp"
#include "uplimit/http-request.hpp"
#include "uplimit/http-response.hpp"
#include "uplimit/http-status-code.hpp"
#include "uplimit/limit-policy.hpp"
#include "uplimit/middleware.hpp"
#include "uplimit/payload-too-large.hpp"
#include "uplimit/request-pipeline.hpp"
#include "uplimit/request-task.hpp"
#include "uplimit/upload-limit-config.hpp"
#include "uplimit/upload-limit.hpp"
// IWYU pragma: end_exports
