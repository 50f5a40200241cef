#include"JobLedger.hpp"
#include"GisExceptions.hpp"
#include"Logger.hpp"

namespace canoclass {

	namespace {
		constexpr uint64_t FNV_PRIME = 1099511628211ull;

		uint64_t fnvUpdate(uint64_t hash, const char* data, size_t n) {
			for (size_t i = 0; i < n; ++i) {
				hash ^= (uint64_t)(unsigned char)data[i];
				hash *= FNV_PRIME;
			}
			return hash;
		}
	}

	uint64_t fingerprintString(const std::string& s, uint64_t basis)
	{
		return fnvUpdate(basis, s.data(), s.size());
	}

	uint64_t fingerprintFile(const std::filesystem::path& file)
	{
		std::ifstream in{ file, std::ios::binary };
		if (!in) {
			throw InputNotFoundException("Unable to read " + file.string());
		}
		uint64_t hash = 14695981039346656037ull;
		std::array<char, 1 << 16> buffer;
		while (in) {
			in.read(buffer.data(), buffer.size());
			hash = fnvUpdate(hash, buffer.data(), (size_t)in.gcount());
		}
		if (in.bad()) {
			throw IOFailureException("Error reading " + file.string());
		}
		return hash;
	}

	std::string fingerprintToString(uint64_t fingerprint)
	{
		std::stringstream ss;
		ss << std::hex << std::setw(16) << std::setfill('0') << fingerprint;
		return ss.str();
	}

	JobLedger::JobLedger(const std::filesystem::path& outputRoot)
		: _root(outputRoot)
	{
		std::filesystem::path file = _root / FILENAME;
		if (!std::filesystem::exists(file)) {
			return;
		}
		std::ifstream in{ file };
		std::string line;
		int lineNumber = 0;
		while (std::getline(in, line)) {
			++lineNumber;
			if (line.empty()) {
				continue;
			}
			size_t firstTab = line.find('\t');
			size_t secondTab = firstTab == std::string::npos ? std::string::npos : line.find('\t', firstTab + 1);
			if (secondTab == std::string::npos) {
				Logger::warn("Ignoring malformed line " + std::to_string(lineNumber) + " of " + file.string());
				continue;
			}
			std::string fp = line.substr(secondTab + 1);
			uint64_t fingerprint = 0;
			try {
				size_t used = 0;
				fingerprint = std::stoull(fp, &used, 16);
				if (used != fp.size()) {
					throw std::invalid_argument(fp);
				}
			}
			catch (const std::logic_error&) {
				Logger::warn("Ignoring malformed line " + std::to_string(lineNumber) + " of " + file.string());
				continue;
			}
			_entries[line.substr(0, firstTab)] = Entry{ line.substr(firstTab + 1, secondTab - firstTab - 1), fingerprint };
		}
	}

	JobLedger::Status JobLedger::check(const std::filesystem::path& output, const std::string& operationKey, uint64_t fingerprint) const
	{
		std::scoped_lock<std::mutex> lock{ _mut };
		auto it = _entries.find(_key(output));
		if (it == _entries.end()) {
			return Status::Missing;
		}
		if (it->second.operationKey == operationKey && it->second.fingerprint == fingerprint) {
			return Status::Matches;
		}
		return Status::Differs;
	}

	void JobLedger::record(const std::filesystem::path& output, const std::string& operationKey, uint64_t fingerprint)
	{
		std::scoped_lock<std::mutex> lock{ _mut };
		_entries[_key(output)] = Entry{ operationKey, fingerprint };
		_save();
	}

	size_t JobLedger::size() const
	{
		std::scoped_lock<std::mutex> lock{ _mut };
		return _entries.size();
	}

	std::string JobLedger::_key(const std::filesystem::path& output) const
	{
		return output.lexically_relative(_root).generic_string();
	}

	void JobLedger::_save() const
	{
		std::filesystem::path file = _root / FILENAME;
		std::filesystem::path temp = file;
		temp += ".tmp";
		{
			std::ofstream out{ temp, std::ios::trunc };
			for (const auto& [key, entry] : _entries) {
				out << key << '\t' << entry.operationKey << '\t' << fingerprintToString(entry.fingerprint) << '\n';
			}
			out.flush();
			if (!out) {
				std::error_code ec;
				std::filesystem::remove(temp, ec);
				throw IOFailureException("Unable to write " + temp.string());
			}
		}
		std::error_code ec;
		std::filesystem::rename(temp, file, ec);
		if (ec) {
			std::filesystem::remove(temp, ec);
			throw IOFailureException("Unable to replace " + file.string());
		}
	}
}
