#include"GisExceptions.hpp"

namespace canoclass {

	std::string errorKindName(ErrorKind kind)
	{
		switch (kind) {
		case ErrorKind::InputNotFound:
			return "InputNotFound";
		case ErrorKind::AlignmentMismatch:
			return "AlignmentMismatch";
		case ErrorKind::InsufficientClasses:
			return "InsufficientClasses";
		case ErrorKind::IOFailure:
			return "IOFailure";
		case ErrorKind::UnsupportedFormat:
			return "UnsupportedFormat";
		}
		return "Unknown";
	}

	CanoClassException::CanoClassException(ErrorKind kind, const std::string& error)
		: std::runtime_error(error), _kind(kind) {}
	ErrorKind CanoClassException::kind() const
	{
		return _kind;
	}

	InputNotFoundException::InputNotFoundException(const std::string& error)
		: CanoClassException(ErrorKind::InputNotFound, error) {}
	AlignmentMismatchException::AlignmentMismatchException(const std::string& error)
		: CanoClassException(ErrorKind::AlignmentMismatch, error) {}
	InsufficientClassesException::InsufficientClassesException(const std::string& error)
		: CanoClassException(ErrorKind::InsufficientClasses, error) {}
	IOFailureException::IOFailureException(const std::string& error)
		: CanoClassException(ErrorKind::IOFailure, error) {}
	UnsupportedFormatException::UnsupportedFormatException(const std::string& error)
		: CanoClassException(ErrorKind::UnsupportedFormat, error) {}

	WrongGeometryTypeException::WrongGeometryTypeException(const std::string& error)
		: UnsupportedFormatException(error) {}
	WrongFieldTypeException::WrongFieldTypeException(const std::string& error)
		: UnsupportedFormatException(error) {}
}
