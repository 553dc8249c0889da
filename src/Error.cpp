#include "unitfleet/Error.hpp"
#include <utility>

namespace unitfleet {
	//------------------------------------------------------------
	//	Имя категории ошибки
	//------------------------------------------------------------
	const char* toString(ErrorKind kind) {
		switch (kind)
		{
		case ErrorKind::None: return "OK";
		case ErrorKind::Config: return "ConfigError";
		case ErrorKind::Manifest: return "ManifestError";
		case ErrorKind::EmptyManifest: return "EmptyManifestError";
		case ErrorKind::Collision: return "CollisionError";
		case ErrorKind::Copy: return "CopyError";
		case ErrorKind::ServiceCommand: return "ServiceCommandError";
		case ErrorKind::Privilege: return "PrivilegeError";
		}
		return "UnknownError";
	}
	//------------------------------------------------------------
	//	Запись ошибки и возврат false
	//------------------------------------------------------------
	bool fail(Error* error, ErrorKind kind, std::string message) {
		if (error)
		{
			error->kind = kind;
			error->message = std::move(message);
		}
		return false;
	}
}; //---namespace unitfleet
