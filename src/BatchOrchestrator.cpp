#include"BatchOrchestrator.hpp"
#include"JobLedger.hpp"
#include"Logger.hpp"

namespace fs = std::filesystem;

namespace canoclass {

	namespace {
		size_t countStatus(const std::vector<FileResult>& files, FileStatus status) {
			return std::count_if(files.begin(), files.end(), [&](const FileResult& f) { return f.status == status; });
		}

		void logResult(const FileResult& r) {
			switch (r.status) {
			case FileStatus::Written:
				Logger::info("written " + r.output.string());
				break;
			case FileStatus::Skipped:
				Logger::info("skipped " + r.output.string());
				break;
			case FileStatus::Failed:
				Logger::error("failed " + r.input.string() + ": "
					+ (r.errorKind ? errorKindName(*r.errorKind) : std::string("Error")) + ": " + r.message);
				break;
			}
		}
	}

	std::string fileStatusName(FileStatus status)
	{
		switch (status) {
		case FileStatus::Written:
			return "written";
		case FileStatus::Skipped:
			return "skipped";
		default:
			return "failed";
		}
	}

	size_t BatchReport::nWritten() const
	{
		return countStatus(files, FileStatus::Written);
	}
	size_t BatchReport::nSkipped() const
	{
		return countStatus(files, FileStatus::Skipped);
	}
	size_t BatchReport::nFailed() const
	{
		return countStatus(files, FileStatus::Failed);
	}

	BatchOrchestrator::BatchOrchestrator(const CanoClassSettings& settings)
		: _settings(settings)
	{
	}

	TileListing BatchOrchestrator::listTiles(const TileOperation& op, const fs::path& inDir, const fs::path& outDir)
	{
		std::error_code ec;
		fs::path outCanonical = fs::weakly_canonical(outDir, ec);
		if (ec) {
			outCanonical = outDir;
		}

		TileListing listing;
		auto unreadable = [&](const fs::path& p, const std::string& why) {
			FileResult r;
			r.input = p;
			r.status = FileStatus::Failed;
			r.errorKind = ErrorKind::IOFailure;
			r.message = p.string() + " could not be read: " + why;
			listing.unreadable.push_back(std::move(r));
		};

		fs::recursive_directory_iterator it{ inDir, ec };
		if (ec) {
			throw InputNotFoundException("Unable to read input directory " + inDir.string() + ": " + ec.message());
		}
		while (it != fs::recursive_directory_iterator()) {
			const fs::path p = it->path();
			std::error_code statusEc;
			if (it->is_directory(statusEc)) {
				std::error_code canonicalEc;
				fs::path canonical = fs::weakly_canonical(p, canonicalEc);
				if (!canonicalEc && canonical == outCanonical) {
					it.disable_recursion_pending();
				}
				else {
					//open it here so a directory that can't be listed is reported rather than ending the walk
					std::error_code openEc;
					fs::directory_iterator check{ p, openEc };
					if (openEc) {
						unreadable(p, openEc.message());
						it.disable_recursion_pending();
					}
				}
			}
			else if (op.accepts(p)) {
				std::error_code fileEc;
				if (it->is_regular_file(fileEc)) {
					listing.files.push_back(p);
				}
				else {
					unreadable(p, fileEc ? fileEc.message() : std::string("not a regular file"));
				}
			}

			it.increment(ec);
			if (ec) {
				unreadable(p, ec.message());
				break;
			}
		}
		std::sort(listing.files.begin(), listing.files.end());
		return listing;
	}

	fs::path BatchOrchestrator::outputPath(const TileOperation& op, const fs::path& inDir, const fs::path& outDir, const fs::path& input)
	{
		fs::path relDir = input.parent_path().lexically_relative(inDir);
		fs::path dir = (relDir.empty() || relDir == ".") ? outDir : outDir / relDir;
		return dir / (op.prefix() + input.filename().string());
	}

	BatchReport BatchOrchestrator::run(const TileOperation& op, const fs::path& inDir, const fs::path& outDir) const
	{
		if (!fs::is_directory(inDir)) {
			throw InputNotFoundException("Input directory " + inDir.string() + " does not exist");
		}
		fs::create_directories(outDir);

		TileListing listing = listTiles(op, inDir, outDir);
		const std::vector<fs::path>& files = listing.files;
		Logger::debug("Found " + std::to_string(files.size()) + " files to process in " + inDir.string());
		for (const FileResult& r : listing.unreadable) {
			logResult(r);
		}

		JobLedger ledger{ outDir };
		const std::string key = op.operationKey();
		const std::string params = op.parameters();

		std::vector<std::optional<FileResult>> slots(files.size());
		std::atomic<size_t> next = 0;
		std::atomic<bool> stop = !listing.unreadable.empty() && _settings.errorPolicy == ErrorPolicy::Stop;
		std::mutex dirMut;

		auto processFile = [&](const fs::path& input) {
			FileResult r;
			r.input = input;
			r.output = outputPath(op, inDir, outDir, input);
			try {
				uint64_t fingerprint = fingerprintString(params, fingerprintFile(input));
				if (!_settings.force && fs::exists(r.output)
					&& ledger.check(r.output, key, fingerprint) != JobLedger::Status::Differs) {
					r.status = FileStatus::Skipped;
					return r;
				}
				{
					std::scoped_lock<std::mutex> lock{ dirMut };
					fs::create_directories(r.output.parent_path());
				}
				op.run(input, r.output);
				ledger.record(r.output, key, fingerprint);
				r.status = FileStatus::Written;
			}
			catch (const CanoClassException& e) {
				r.status = FileStatus::Failed;
				r.errorKind = e.kind();
				r.message = e.what();
			}
			catch (const fs::filesystem_error& e) {
				r.status = FileStatus::Failed;
				r.errorKind = ErrorKind::IOFailure;
				r.message = e.what();
			}
			catch (const std::exception& e) {
				r.status = FileStatus::Failed;
				r.message = e.what();
			}
			return r;
			};

		auto worker = [&]() {
			while (!stop) {
				size_t i = next++;
				if (i >= files.size()) {
					return;
				}
				slots[i] = processFile(files[i]);
				logResult(*slots[i]);
				if (slots[i]->status == FileStatus::Failed && _settings.errorPolicy == ErrorPolicy::Stop) {
					stop = true;
				}
			}
			};

		size_t nThread = std::clamp<size_t>((size_t)_settings.threads, 1, std::max<size_t>(files.size(), 1));
		std::vector<std::thread> threads;
		for (size_t t = 0; t < nThread; ++t) {
			threads.emplace_back(worker);
		}
		for (std::thread& t : threads) {
			t.join();
		}

		BatchReport report;
		for (std::optional<FileResult>& slot : slots) {
			if (slot) {
				report.files.push_back(std::move(*slot));
			}
		}
		report.stopped = report.files.size() < files.size();
		for (FileResult& r : listing.unreadable) {
			report.files.push_back(std::move(r));
		}
		std::sort(report.files.begin(), report.files.end(), [](const FileResult& a, const FileResult& b) { return a.input < b.input; });

		Logger::info(std::to_string(report.nWritten()) + " written, " + std::to_string(report.nSkipped()) + " skipped, "
			+ std::to_string(report.nFailed()) + " failed" + (report.stopped ? " (stopped after the first failure)" : ""));
		return report;
	}
}
