#include <techscreen/route/Job.hpp>

#include <techscreen/core/Identifiers.hpp>

#include <array>
#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>

namespace TS::Route {
namespace {

using json = nlohmann::json;

constexpr std::array<ReasonCode, 8> kReasonCodes = {
    ReasonCode::CustomerNotHome,
    ReasonCode::WeatherDelay,
    ReasonCode::RescheduledAtCustomerRequest,
    ReasonCode::RouteEfficiency,
    ReasonCode::UnsafeWeatherConditions,
    ReasonCode::EquipmentMalfunction,
    ReasonCode::ChemicalAvailability,
    ReasonCode::Other,
};

constexpr std::array<std::string_view, 12> kMonthAbbreviations = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec",
};

struct CivilTime {
    int      year;
    unsigned month;
    unsigned day;
    long     hours;
    long     minutes;
    long     seconds;
};

auto to_civil(TimePoint time) -> CivilTime {
    auto const day = std::chrono::floor<std::chrono::days>(time);
    std::chrono::year_month_day const ymd{day};
    std::chrono::hh_mm_ss const hms{std::chrono::floor<std::chrono::seconds>(time - day)};
    return CivilTime{static_cast<int>(ymd.year()),
                     static_cast<unsigned>(ymd.month()),
                     static_cast<unsigned>(ymd.day()),
                     static_cast<long>(hms.hours().count()),
                     static_cast<long>(hms.minutes().count()),
                     static_cast<long>(hms.seconds().count())};
}

auto bool_text(bool value) -> std::string {
    return value ? "true" : "false";
}

template <typename T>
auto parse_number(std::string_view text, T& out) -> bool {
    auto const* end    = text.data() + text.size();
    auto const  result = std::from_chars(text.data(), end, out);
    return result.ec == std::errc{} && result.ptr == end;
}

auto job_error(std::size_t index, std::string message) -> Error {
    return Error{Error::Code::MalformedInput, "job[" + std::to_string(index) + "] " + std::move(message)};
}

auto read_optional_string(json const& object, char const* key, std::optional<std::string>& out) -> bool {
    auto const it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return true;
    }
    if (!it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

auto read_optional_time(json const& object, char const* key, std::optional<TimePoint>& out) -> bool {
    std::optional<std::string> text;
    if (!read_optional_string(object, key, text)) {
        return false;
    }
    if (text) {
        out = parse_iso8601(*text);
        return out.has_value();
    }
    return true;
}

auto read_optional_double(json const& object, char const* key, std::optional<double>& out) -> bool {
    auto const it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return true;
    }
    if (!it->is_number()) {
        return false;
    }
    out = it->get<double>();
    return true;
}

auto parse_job(json const& entry, std::size_t index) -> Expected<Job> {
    if (!entry.is_object()) {
        return std::unexpected(job_error(index, "must be an object"));
    }
    Job job;

    std::optional<std::string> id;
    std::optional<std::string> customer;
    std::optional<std::string> address;
    std::optional<std::string> status;
    std::optional<TimePoint>   scheduled;
    if (!read_optional_string(entry, "id", id) || !read_optional_string(entry, "customerName", customer)
        || !read_optional_string(entry, "address", address) || !read_optional_string(entry, "status", status)
        || !read_optional_string(entry, "notes", job.notes) || !read_optional_string(entry, "pinnedNotes", job.pinnedNotes)
        || !read_optional_string(entry, "signature", job.signature)) {
        return std::unexpected(job_error(index, "has a non-string text field"));
    }
    if (!read_optional_double(entry, "latitude", job.latitude) || !read_optional_double(entry, "longitude", job.longitude)) {
        return std::unexpected(job_error(index, "has a non-numeric coordinate"));
    }
    if (!read_optional_time(entry, "scheduledDate", scheduled) || !read_optional_time(entry, "startTime", job.startTime)
        || !read_optional_time(entry, "completionTime", job.completionTime)) {
        return std::unexpected(job_error(index, "has a timestamp that is not ISO-8601 UTC"));
    }
    if (!customer || !scheduled) {
        return std::unexpected(job_error(index, "requires 'customerName' and 'scheduledDate'"));
    }

    job.id            = id.value_or(freshId());
    job.customerName  = std::move(*customer);
    job.address       = address.value_or("");
    job.scheduledDate = *scheduled;
    if (status) {
        auto parsed = parse_job_status(*status);
        if (!parsed) {
            return std::unexpected(job_error(index, "has unknown status '" + *status + "'"));
        }
        job.status = *parsed;
    }
    return job;
}

} // namespace

auto status_name(JobStatus status) -> std::string_view {
    switch (status) {
    case JobStatus::Pending:
        return "pending";
    case JobStatus::InProgress:
        return "inProgress";
    case JobStatus::Completed:
        return "completed";
    case JobStatus::Skipped:
        return "skipped";
    }
    return "pending";
}

auto status_display_name(JobStatus status) -> std::string_view {
    switch (status) {
    case JobStatus::Pending:
        return "Pending";
    case JobStatus::InProgress:
        return "In Progress";
    case JobStatus::Completed:
        return "Completed";
    case JobStatus::Skipped:
        return "Skipped";
    }
    return "Pending";
}

auto parse_job_status(std::string_view name) -> std::optional<JobStatus> {
    for (auto status : {JobStatus::Pending, JobStatus::InProgress, JobStatus::Completed, JobStatus::Skipped}) {
        if (status_name(status) == name) {
            return status;
        }
    }
    return std::nullopt;
}

auto reason_codes() -> std::span<ReasonCode const> {
    return kReasonCodes;
}

auto reason_code_text(ReasonCode code) -> std::string_view {
    switch (code) {
    case ReasonCode::CustomerNotHome:
        return "Customer not home";
    case ReasonCode::WeatherDelay:
        return "Weather delay";
    case ReasonCode::RescheduledAtCustomerRequest:
        return "Rescheduled at customer request";
    case ReasonCode::RouteEfficiency:
        return "Route efficiency";
    case ReasonCode::UnsafeWeatherConditions:
        return "Unsafe weather conditions";
    case ReasonCode::EquipmentMalfunction:
        return "Equipment malfunction";
    case ReasonCode::ChemicalAvailability:
        return "Chemical not available";
    case ReasonCode::Other:
        return "Other";
    }
    return "Other";
}

auto JobFieldValue(Job const& job, std::string_view key) -> std::optional<std::string> {
    if (key == "customerName") {
        return job.customerName;
    }
    if (key == "address") {
        return job.address;
    }
    if (key == "scheduledTime") {
        return format_short_time(job.scheduledDate);
    }
    if (key == "scheduledDate") {
        return format_medium_date(job.scheduledDate);
    }
    if (key == "scheduledDateTime") {
        return format_date_time(job.scheduledDate);
    }
    if (key == "status") {
        return std::string{status_display_name(job.status)};
    }
    if (key == "statusColor") {
        std::string token{status_name(job.status)};
        for (auto& c : token) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return token;
    }
    if (key == "pinnedNotes") {
        return job.pinnedNotes;
    }
    if (key == "notes") {
        return job.notes;
    }
    if (key == "id") {
        return job.id;
    }
    if (key == "isActive") {
        return bool_text(job.status == JobStatus::InProgress);
    }
    if (key == "isCompleted") {
        return bool_text(job.status == JobStatus::Completed);
    }
    if (key == "isPending") {
        return bool_text(job.status == JobStatus::Pending);
    }
    if (key == "isSkipped") {
        return bool_text(job.status == JobStatus::Skipped);
    }
    return std::nullopt;
}

auto format_short_time(TimePoint time) -> std::string {
    auto const civil  = to_civil(time);
    auto const hour12 = civil.hours % 12 == 0 ? 12 : civil.hours % 12;
    std::ostringstream stream;
    stream << hour12 << ':' << std::setw(2) << std::setfill('0') << civil.minutes << (civil.hours < 12 ? " AM" : " PM");
    return stream.str();
}

auto format_medium_date(TimePoint time) -> std::string {
    auto const civil = to_civil(time);
    std::ostringstream stream;
    stream << kMonthAbbreviations[civil.month - 1] << ' ' << civil.day << ", " << civil.year;
    return stream.str();
}

auto format_date_time(TimePoint time) -> std::string {
    return format_medium_date(time) + " at " + format_short_time(time);
}

auto format_iso8601(TimePoint time) -> std::string {
    auto const civil = to_civil(time);
    std::ostringstream stream;
    stream << std::setfill('0') << std::setw(4) << civil.year << '-' << std::setw(2) << civil.month << '-'
           << std::setw(2) << civil.day << 'T' << std::setw(2) << civil.hours << ':' << std::setw(2) << civil.minutes
           << ':' << std::setw(2) << civil.seconds << 'Z';
    return stream.str();
}

auto parse_iso8601(std::string_view text) -> std::optional<TimePoint> {
    // YYYY-MM-DDTHH:MM:SSZ
    if (text.size() != 20 || text[4] != '-' || text[7] != '-' || text[10] != 'T' || text[13] != ':' || text[16] != ':'
        || text[19] != 'Z') {
        return std::nullopt;
    }
    int      year = 0;
    unsigned month = 0;
    unsigned day = 0;
    int      hours = 0;
    int      minutes = 0;
    int      seconds = 0;
    if (!parse_number(text.substr(0, 4), year) || !parse_number(text.substr(5, 2), month)
        || !parse_number(text.substr(8, 2), day) || !parse_number(text.substr(11, 2), hours)
        || !parse_number(text.substr(14, 2), minutes) || !parse_number(text.substr(17, 2), seconds)) {
        return std::nullopt;
    }
    std::chrono::year_month_day const ymd{std::chrono::year{year}, std::chrono::month{month}, std::chrono::day{day}};
    if (!ymd.ok() || hours > 23 || minutes > 59 || seconds > 59) {
        return std::nullopt;
    }
    return TimePoint{std::chrono::sys_days{ymd}} + std::chrono::hours{hours} + std::chrono::minutes{minutes}
           + std::chrono::seconds{seconds};
}

auto ParseJobs(nlohmann::json const& payload) -> Expected<std::vector<Job>> {
    json const* entries = &payload;
    if (payload.is_object()) {
        auto const it = payload.find("jobs");
        if (it == payload.end()) {
            return std::unexpected(Error{Error::Code::MalformedInput, "route fixture missing 'jobs'"});
        }
        entries = &(*it);
    }
    if (!entries->is_array()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "route fixture must be an array of jobs"});
    }

    std::vector<Job> jobs;
    jobs.reserve(entries->size());
    for (std::size_t index = 0; index < entries->size(); ++index) {
        auto job = parse_job((*entries)[index], index);
        if (!job) {
            return std::unexpected(job.error());
        }
        jobs.push_back(std::move(*job));
    }
    return jobs;
}

auto EncodeJob(Job const& job) -> nlohmann::json {
    json object{
        {"id", job.id},
        {"customerName", job.customerName},
        {"address", job.address},
        {"scheduledDate", format_iso8601(job.scheduledDate)},
        {"status", std::string{status_name(job.status)}},
    };
    if (job.latitude) {
        object["latitude"] = *job.latitude;
    }
    if (job.longitude) {
        object["longitude"] = *job.longitude;
    }
    if (job.notes) {
        object["notes"] = *job.notes;
    }
    if (job.pinnedNotes) {
        object["pinnedNotes"] = *job.pinnedNotes;
    }
    if (job.startTime) {
        object["startTime"] = format_iso8601(*job.startTime);
    }
    if (job.completionTime) {
        object["completionTime"] = format_iso8601(*job.completionTime);
    }
    object["hasSignature"] = job.signature.has_value();
    return object;
}

} // namespace TS::Route
