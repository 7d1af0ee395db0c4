#include <slotbook/Archiver.hpp>
#include <slotbook/errors.hpp>
#include <slotbook/logging.hpp>

#include <string>
#include <vector>

namespace slotbook {

    Archiver::Archiver(const StoreConfig& config, std::shared_ptr<RecordStore> store)
        : archive_dir_(config.archivePath())
        , store_(std::move(store)) {
    }

    ArchiveResult Archiver::archiveOlderThan(int months) {
        if (months < 0) {
            throw ArchivalError("Archive age must not be negative: " + std::to_string(months));
        }

        ArchiveResult result;
        result.cutoffDate = today().subtractMonths(months);

        try {
            // rewrite() takes the safety backup before locking
            store_->rewrite([&](Workbook& wb) {
                Sheet* sheet = wb.sheet(kSubmissionsSheet);
                if (!sheet) {
                    throw StoreIOError("Store file has no Submissions sheet");
                }

                std::vector<std::size_t> doomed;
                std::vector<Submission> archived;
                for (std::size_t i = 0; i < sheet->rows.size(); ++i) {
                    Submission s = fromRow(sheet->rows[i]);
                    CalendarDate key = s.bookingDate ? *s.bookingDate : localDate(s.submissionDate);
                    if (key < result.cutoffDate) {
                        doomed.push_back(i);
                        archived.push_back(std::move(s));
                    }
                }
                if (doomed.empty()) {
                    return false;
                }

                auto target = archive_dir_ / ("archive_" + result.cutoffDate.toString() + "_" +
                                              std::to_string(doomed.size()) + "records" +
                                              store_->path().extension().string());
                if (std::filesystem::exists(target)) {
                    target = archive_dir_ / ("archive_" + result.cutoffDate.toString() + "_" +
                                             std::to_string(doomed.size()) + "records_" +
                                             std::to_string(uniqueMillis()) + store_->path().extension().string());
                }
                FileJsonStorage out(target);
                out.saveState(nlohmann::json(makeSubmissionWorkbook("Archived Submissions", archived)));

                for (auto it = doomed.rbegin(); it != doomed.rend(); ++it) {
                    sheet->rows.erase(sheet->rows.begin() + static_cast<std::ptrdiff_t>(*it));
                }
                setSummaryValue(wb, kTotalMetric, static_cast<long long>(sheet->rows.size()));

                result.archivedCount = doomed.size();
                result.archivePath = target;
                return true;
            });
        } catch (const ArchivalError&) {
            throw;
        } catch (const std::exception& ex) {
            log::get()->error("Archive failed: {}", ex.what());
            throw ArchivalError(std::string("Archive failed: ") + ex.what());
        }

        if (result.archivedCount == 0) {
            log::get()->info("No records older than {} to archive", result.cutoffDate.toString());
        } else {
            log::get()->info("Archived {} records to {}", result.archivedCount, result.archivePath->string());
        }
        return result;
    }

    void to_json(nlohmann::json& j, const ArchiveResult& r) {
        j = nlohmann::json{{"success", true},
                           {"archivedCount", r.archivedCount},
                           {"cutoffDate", r.cutoffDate.toString()},
                           {"message", r.archivedCount == 0 ? std::string("No records to archive")
                                                            : "Successfully archived " + std::to_string(r.archivedCount) + " records"}};
        if (r.archivePath) {
            j["archivePath"] = r.archivePath->string();
        }
    }

} // namespace slotbook
