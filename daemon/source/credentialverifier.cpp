#include "credentialverifier.hpp"

std::string_view ToString(const VerificationOutcome Outcome)
{
	switch (Outcome)
	{
	case VerificationOutcome::Success:
		return "success";
	case VerificationOutcome::WrongCredential:
		return "wrong credential";
	case VerificationOutcome::Cancelled:
		return "cancelled";
	case VerificationOutcome::Unavailable:
		return "verifier unavailable";
	case VerificationOutcome::TimedOut:
		return "timed out";
	}
	return "unknown";
}
