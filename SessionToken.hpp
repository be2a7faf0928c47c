// File: SessionToken.hpp
// Description: Opaque, unguessable combat session ids.
#pragma once

#include <string>

static const std::size_t SESSION_TOKEN_BYTES = 16;

// 32 lowercase hex characters from libsodium's CSPRNG.
std::string generateSessionToken();
