#pragma once

#include <techscreen/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace TS::Route {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class JobStatus {
    Pending,
    InProgress,
    Completed,
    Skipped,
};

// Classification a technician must supply before a skip or reorder is applied.
enum class ReasonCode {
    CustomerNotHome,
    WeatherDelay,
    RescheduledAtCustomerRequest,
    RouteEfficiency,
    UnsafeWeatherConditions,
    EquipmentMalfunction,
    ChemicalAvailability,
    Other,
};

struct Job {
    std::string                id;
    std::string                customerName;
    std::string                address;
    TimePoint                  scheduledDate{};
    std::optional<double>      latitude;
    std::optional<double>      longitude;
    std::optional<std::string> notes;
    std::optional<std::string> pinnedNotes;
    JobStatus                  status = JobStatus::Pending;
    std::optional<TimePoint>   startTime;
    std::optional<TimePoint>   completionTime;
    // Opaque captured signature payload.
    std::optional<std::string> signature;
};

// Wire name: "pending", "inProgress", "completed", "skipped".
[[nodiscard]] auto status_name(JobStatus status) -> std::string_view;
[[nodiscard]] auto status_display_name(JobStatus status) -> std::string_view;
[[nodiscard]] auto parse_job_status(std::string_view name) -> std::optional<JobStatus>;

[[nodiscard]] auto reason_codes() -> std::span<ReasonCode const>;
[[nodiscard]] auto reason_code_text(ReasonCode code) -> std::string_view;

/*
 * Entity field lookup used by bindings. Known keys: customerName, address,
 * scheduledTime, scheduledDate, scheduledDateTime, status, statusColor,
 * pinnedNotes, notes, id, isActive, isCompleted, isPending, isSkipped.
 * Unknown keys and unset optional fields yield nullopt.
 */
[[nodiscard]] auto JobFieldValue(Job const& job, std::string_view key) -> std::optional<std::string>;

// Time formatting is done in UTC: "8:05 AM", "Sep 25, 2025", "Sep 25, 2025 at 8:05 AM".
[[nodiscard]] auto format_short_time(TimePoint time) -> std::string;
[[nodiscard]] auto format_medium_date(TimePoint time) -> std::string;
[[nodiscard]] auto format_date_time(TimePoint time) -> std::string;
// "2025-09-25T08:05:00Z"
[[nodiscard]] auto format_iso8601(TimePoint time) -> std::string;
[[nodiscard]] auto parse_iso8601(std::string_view text) -> std::optional<TimePoint>;

// Route fixture: a JSON array of job objects, or `{"jobs": [...]}`.
[[nodiscard]] auto ParseJobs(nlohmann::json const& payload) -> Expected<std::vector<Job>>;
[[nodiscard]] auto EncodeJob(Job const& job) -> nlohmann::json;

} // namespace TS::Route
