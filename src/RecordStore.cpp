#include <slotbook/RecordStore.hpp>
#include <slotbook/errors.hpp>
#include <slotbook/logging.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <system_error>
#include <unordered_set>

namespace slotbook {

    namespace {

        std::string lower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        bool contains(const std::string& haystack, const std::string& needle) {
            return haystack.find(needle) != std::string::npos;
        }

        bool occupiesDay(const Submission& s, const CalendarDate& date) {
            return s.bookingDate && *s.bookingDate == date && s.status != SubmissionStatus::Archived;
        }

        std::size_t countOn(const std::vector<Submission>& rows, const CalendarDate& date) {
            return static_cast<std::size_t>(std::count_if(rows.begin(), rows.end(), [&](const Submission& s) {
                return occupiesDay(s, date);
            }));
        }

        Sheet& submissionsSheet(Workbook& wb) {
            Sheet* sheet = wb.sheet(kSubmissionsSheet);
            if (!sheet) {
                throw StoreIOError("Store file has no Submissions sheet");
            }
            return *sheet;
        }

        long long summaryTotal(const Workbook& wb) {
            auto value = summaryValue(wb, kTotalMetric);
            if (value && value->is_number_integer()) {
                return value->get<long long>();
            }
            return 0;
        }

        std::optional<std::size_t> findRow(const Sheet& sheet, const std::string& id) {
            for (std::size_t i = 0; i < sheet.rows.size(); ++i) {
                auto const& row = sheet.rows[i];
                if (row.is_array() && !row.empty() && row[0].is_string() && row[0].get<std::string>() == id) {
                    return i;
                }
            }
            return std::nullopt;
        }

        void applyPatch(Submission& s, const SubmissionPatch& patch) {
            if (patch.status) {
                s.status = *patch.status;
            }
            if (patch.bookingDate) {
                s.bookingDate = patch.bookingDate;
            }
            if (patch.name) {
                s.name = *patch.name;
            }
            if (patch.upiNumber) {
                s.upiNumber = *patch.upiNumber;
            }
            if (patch.whatsappNumber) {
                s.whatsappNumber = *patch.whatsappNumber;
            }
            if (patch.ayambilShalaName) {
                s.ayambilShalaName = *patch.ayambilShalaName;
            }
            if (patch.city) {
                s.city = *patch.city;
            }
        }

        std::string capacityMessage(const CalendarDate& date, std::size_t count, std::size_t max) {
            return "This date is fully booked (" + std::to_string(count) + "/" + std::to_string(max) +
                   " bookings): " + date.toString();
        }

    } // namespace

    RecordStore::RecordStore(const StoreConfig& config, std::shared_ptr<BackupManager> backups)
        : storage_(std::make_unique<FileJsonStorage>(config.storePath(), config.atomicWrites))
        , export_dir_(config.exportPath())
        , lock_reads_(config.lockReads)
        , atomic_writes_(config.atomicWrites)
        , backups_(std::move(backups))
        , lock_(config.storePath(), config.lock) {
    }

    Workbook RecordStore::load() const {
        nlohmann::json j = storage_->loadState();
        Workbook wb;
        try {
            from_json(j, wb);
        } catch (const nlohmann::json::exception& ex) {
            throw StoreIOError("Corrupt store file " + path().string() + ": " + ex.what());
        }
        return wb;
    }

    Workbook RecordStore::loadForRead() const {
        if (lock_reads_) {
            return lock_.withLock([this] { return load(); });
        }
        return load();
    }

    void RecordStore::save(Workbook& wb) {
        setSummaryValue(wb, kLastUpdatedMetric, formatIso(now()));
        storage_->saveState(nlohmann::json(wb));
    }

    void RecordStore::initialize() {
        if (storage_->exists()) {
            log::get()->info("Store file already exists: {}", path().string());
            return;
        }
        lock_.withLock([this] {
            if (storage_->exists()) {
                return;
            }
            Workbook wb = makeStoreWorkbook();
            save(wb);
            log::get()->info("Store file initialized at {}", path().string());
        });
    }

    void RecordStore::rewrite(const std::function<bool(Workbook&)>& fn) {
        if (backups_) {
            backups_->createBackup();
        }
        lock_.withLock([&] {
            Workbook wb = load();
            lock_.refresh();
            if (fn(wb)) {
                lock_.refresh();
                save(wb);
            }
        });
    }

    Submission RecordStore::insert(Workbook& wb, const SubmissionInput& input) {
        Sheet& sheet = submissionsSheet(wb);

        std::unordered_set<std::string> ids;
        for (auto const& row : sheet.rows) {
            if (row.is_array() && !row.empty() && row[0].is_string()) {
                ids.insert(row[0].get<std::string>());
            }
        }

        Submission s;
        do {
            s.id = generateSubmissionId();
        } while (ids.count(s.id) != 0);
        s.submissionDate = now();
        s.bookingDate = input.bookingDate;
        s.name = input.name;
        s.upiNumber = input.upiNumber;
        s.whatsappNumber = input.whatsappNumber;
        s.ayambilShalaName = input.ayambilShalaName;
        s.city = input.city;
        s.status = SubmissionStatus::Pending;
        s.ipAddress = input.ipAddress;

        sheet.rows.push_back(toRow(s));
        setSummaryValue(wb, kTotalMetric, summaryTotal(wb) + 1);
        return s;
    }

    Submission RecordStore::add(const SubmissionInput& input) {
        Submission out;
        rewrite([&](Workbook& wb) {
            out = insert(wb, input);
            return true;
        });
        log::get()->info("Submission {} added", out.id);
        return out;
    }

    Submission RecordStore::addWithinCapacity(const SubmissionInput& input, std::size_t maxPerDay) {
        Submission out;
        rewrite([&](Workbook& wb) {
            if (input.bookingDate) {
                auto count = countOn(readSubmissions(wb), *input.bookingDate);
                if (count >= maxPerDay) {
                    throw CapacityExceededError(capacityMessage(*input.bookingDate, count, maxPerDay));
                }
            }
            out = insert(wb, input);
            return true;
        });
        log::get()->info("Submission {} added", out.id);
        return out;
    }

    std::vector<Submission> RecordStore::list(const SubmissionFilter& filter) const {
        auto all = readSubmissions(loadForRead());
        std::vector<Submission> out;
        out.reserve(all.size());
        // rows are appended in arrival order; walking backwards keeps same-millisecond rows newest first
        for (auto it = all.rbegin(); it != all.rend(); ++it) {
            if (filter.matches(*it)) {
                out.push_back(std::move(*it));
            }
        }
        std::stable_sort(out.begin(), out.end(), [](const Submission& a, const Submission& b) {
            return a.submissionDate > b.submissionDate;
        });
        return out;
    }

    std::optional<Submission> RecordStore::getById(const std::string& id) const {
        for (auto& s : readSubmissions(loadForRead())) {
            if (s.id == id) {
                return s;
            }
        }
        return std::nullopt;
    }

    Submission RecordStore::update(const std::string& id, const SubmissionPatch& patch,
                                   std::optional<std::size_t> maxPerDay) {
        Submission out;
        rewrite([&](Workbook& wb) {
            Sheet& sheet = submissionsSheet(wb);
            auto index = findRow(sheet, id);
            if (!index) {
                throw NotFoundError("Submission not found: " + id);
            }
            Submission s = fromRow(sheet.rows[*index]);
            bool moving = patch.bookingDate && (!s.bookingDate || *s.bookingDate != *patch.bookingDate);
            bool wasArchived = s.status == SubmissionStatus::Archived;
            applyPatch(s, patch);
            // an archived row frees its slot, so bringing it back claims one again
            bool reactivating = wasArchived && s.status != SubmissionStatus::Archived;

            if (maxPerDay && (moving || reactivating) && s.bookingDate && s.status != SubmissionStatus::Archived) {
                auto count = countOn(readSubmissions(wb), *s.bookingDate);
                if (count >= *maxPerDay) {
                    throw CapacityExceededError(capacityMessage(*s.bookingDate, count, *maxPerDay));
                }
            }

            sheet.rows[*index] = toRow(s);
            out = s;
            return true;
        });
        log::get()->info("Submission {} updated", id);
        return out;
    }

    void RecordStore::remove(const std::string& id) {
        rewrite([&](Workbook& wb) {
            Sheet& sheet = submissionsSheet(wb);
            auto index = findRow(sheet, id);
            if (!index) {
                throw NotFoundError("Submission not found: " + id);
            }
            sheet.rows.erase(sheet.rows.begin() + static_cast<std::ptrdiff_t>(*index));
            setSummaryValue(wb, kTotalMetric, std::max(0LL, summaryTotal(wb) - 1));
            return true;
        });
        log::get()->info("Submission {} deleted", id);
    }

    std::vector<Submission> RecordStore::search(const std::string& query) const {
        const std::string q = lower(query);
        std::vector<Submission> out;
        for (auto& s : list()) {
            if (contains(lower(s.name), q) ||
                contains(s.upiNumber, query) ||
                contains(s.whatsappNumber, query) ||
                contains(lower(s.ayambilShalaName), q) ||
                contains(lower(s.city), q) ||
                contains(lower(s.id), q)) {
                out.push_back(std::move(s));
            }
        }
        return out;
    }

    Statistics RecordStore::statistics() const {
        auto all = readSubmissions(loadForRead());
        const CalendarDate day = today();

        Statistics st;
        st.total = all.size();
        for (auto const& s : all) {
            if (localDate(s.submissionDate) == day) {
                ++st.today;
            }
            switch (s.status) {
                case SubmissionStatus::Pending:
                    ++st.pending;
                    break;
                case SubmissionStatus::Reviewed:
                    ++st.reviewed;
                    break;
                case SubmissionStatus::Archived:
                    ++st.archived;
                    break;
            }
        }

        std::error_code ec;
        auto bytes = std::filesystem::file_size(path(), ec);
        if (ec) {
            throw StoreIOError("Cannot stat store file " + path().string() + ": " + ec.message());
        }
        st.fileSizeMB = std::round(static_cast<double>(bytes) / (1024.0 * 1024.0) * 100.0) / 100.0;
        return st;
    }

    std::filesystem::path RecordStore::exportFiltered(const SubmissionFilter& filter) const {
        auto rows = list(filter);
        Workbook wb = makeSubmissionWorkbook("Submissions Export", rows);

        auto target = export_dir_ / ("export_" + today().toString() + "_" + std::to_string(uniqueMillis()) +
                                     path().extension().string());
        FileJsonStorage out(target, atomic_writes_);
        out.saveState(nlohmann::json(wb));
        log::get()->info("Exported {} submission(s) to {}", rows.size(), target.string());
        return target;
    }

    std::size_t RecordStore::countForDate(const CalendarDate& date) const {
        return countOn(readSubmissions(loadForRead()), date);
    }

    std::map<std::string, std::size_t> RecordStore::bookingCountsByDateRange(const CalendarDate& from, const CalendarDate& to) const {
        std::map<std::string, std::size_t> out;
        for (auto const& s : readSubmissions(loadForRead())) {
            if (!s.bookingDate || s.status == SubmissionStatus::Archived) {
                continue;
            }
            if (from <= *s.bookingDate && *s.bookingDate <= to) {
                ++out[s.bookingDate->toString()];
            }
        }
        return out;
    }

    std::size_t RecordStore::rowCount() const {
        Workbook wb = loadForRead();
        return submissionsSheet(wb).rows.size();
    }

} // namespace slotbook
