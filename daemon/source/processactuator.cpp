#include "processactuator.hpp"

std::string_view ToString(const ActionResult Result)
{
	switch (Result)
	{
	case ActionResult::Ok:
		return "ok";
	case ActionResult::NoSuchProcess:
		return "no such process";
	case ActionResult::PermissionDenied:
		return "permission denied";
	case ActionResult::Failed:
		return "failed";
	}
	return "unknown";
}
