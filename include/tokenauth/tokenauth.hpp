#pragma once

// Main public API - include all headers
#include "tokenauth/constants.hpp"
#include "tokenauth/errors.hpp"
#include "tokenauth/claims.hpp"
#include "tokenauth/token.hpp"
#include "tokenauth/validation.hpp"
#include "tokenauth/handler.hpp"
#include "tokenauth/key_loader.hpp"
#include "tokenauth/key_id.hpp"

namespace tokenauth {}
