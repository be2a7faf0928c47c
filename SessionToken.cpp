// File: SessionToken.cpp
// Description: libsodium-backed session token generation.
#include "SessionToken.hpp"
#include <sodium.h>
#include <stdexcept>

std::string generateSessionToken() {
	// Returns 1 when already initialized by the server's startup.
	if (sodium_init() < 0) {
		throw std::runtime_error("libsodium failed to initialize");
	}

	unsigned char raw[SESSION_TOKEN_BYTES];
	randombytes_buf(raw, sizeof raw);

	char hex[SESSION_TOKEN_BYTES * 2 + 1];
	sodium_bin2hex(hex, sizeof hex, raw, sizeof raw);
	return std::string(hex);
}
