#pragma once
#ifndef canoclass_jobledger_h
#define canoclass_jobledger_h

#include"canoclass_pch.hpp"

namespace canoclass {

	//64-bit FNV-1a
	uint64_t fingerprintString(const std::string& s, uint64_t basis = 14695981039346656037ull);
	//the fingerprint of the file's bytes; throws InputNotFoundException if it can't be read
	uint64_t fingerprintFile(const std::filesystem::path& file);
	std::string fingerprintToString(uint64_t fingerprint);

	//Remembers which inputs and parameters produced each output under one output directory.
	//The record is the file .canoclass_ledger in that directory, one tab-separated line per output:
	//the output path relative to the directory, the operation, and the fingerprint.
	//All methods are safe to call from several threads.
	class JobLedger {
	public:
		enum class Status {
			//no record for this output
			Missing,
			Matches,
			Differs
		};

		inline static const std::string FILENAME = ".canoclass_ledger";

		//reads the existing record, if any; lines that can't be parsed are dropped with a warning
		explicit JobLedger(const std::filesystem::path& outputRoot);

		Status check(const std::filesystem::path& output, const std::string& operationKey, uint64_t fingerprint) const;

		//records the output and rewrites the ledger file; throws IOFailureException if it can't be written
		void record(const std::filesystem::path& output, const std::string& operationKey, uint64_t fingerprint);

		size_t size() const;

	private:
		struct Entry {
			std::string operationKey;
			uint64_t fingerprint;
		};
		std::filesystem::path _root;
		std::map<std::string, Entry> _entries;
		mutable std::mutex _mut;

		std::string _key(const std::filesystem::path& output) const;
		void _save() const;
	};
}

#endif
