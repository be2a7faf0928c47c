// File: CombatErrors.hpp
// Description: Error taxonomy for the combat core. Every error carries a
// stable code that the network layer forwards to the client.
#pragma once

#include <stdexcept>
#include <string>

class CombatError : public std::runtime_error
{
public:
	CombatError(std::string code, const std::string& message)
		: std::runtime_error(message), code_(std::move(code)) {
	}

	const std::string& code() const noexcept { return code_; }

private:
	std::string code_;
};

// Bad input range or shape. Raised before any mutation happens.
class ValidationError : public CombatError
{
public:
	explicit ValidationError(const std::string& message)
		: CombatError("VALIDATION_ERROR", message) {
	}
};

// Session, location, enemy, material or item missing (or the session expired).
class NotFoundError : public CombatError
{
public:
	NotFoundError(const std::string& what, const std::string& id)
		: CombatError("NOT_FOUND", what + " not found: " + id) {
	}
};

// Action not allowed in the session's current state.
class InvalidStateError : public CombatError
{
public:
	explicit InvalidStateError(const std::string& message)
		: CombatError("INVALID_STATE", message) {
	}
};

// Used by debit paths elsewhere in the economy; grants never raise it.
class InsufficientFundsError : public CombatError
{
public:
	InsufficientFundsError(int required, int available)
		: CombatError("INSUFFICIENT_FUNDS",
			"Insufficient funds: required " + std::to_string(required) +
			", available " + std::to_string(available)) {
	}
};

// Persistence or network failure. transient() marks failures worth retrying
// in place (dropped connection, timeout).
class ExternalDependencyError : public CombatError
{
public:
	ExternalDependencyError(const std::string& message, bool transient)
		: CombatError("EXTERNAL_DEPENDENCY", message), transient_(transient) {
	}

	bool transient() const noexcept { return transient_; }

private:
	bool transient_;
};
