#include <tasksched/io/metrics.hpp>
#include <tasksched/io/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace tasksched::io {

RunMetrics compute_metrics(const std::vector<TraceRecord>& traces) {
    RunMetrics metrics;

    // task_id -> time of the latest task_added
    std::unordered_map<std::string, int64_t> added_at;

    uint64_t used_total = 0;
    uint64_t capacity_total = 0;

    for (const auto& record : traces) {
        if (record.type == "step") {
            metrics.steps++;
            used_total += static_cast<uint64_t>(get_int_field(record, "used_capacity"));
            capacity_total += static_cast<uint64_t>(get_int_field(record, "capacity"));
        }
        else if (record.type == "task_added") {
            metrics.tasks_added++;
            if (get_int_field(record, "initial") != 0) {
                metrics.initial_tasks++;
            } else {
                metrics.mutations_applied++;
            }
            added_at[get_string_field(record, "task_id")] = record.time;
        }
        else if (record.type == "task_modified") {
            metrics.tasks_modified++;
            metrics.mutations_applied++;
        }
        else if (record.type == "task_removed") {
            metrics.tasks_removed++;
            metrics.mutations_applied++;
        }
        else if (record.type == "mutation_rejected") {
            metrics.mutations_rejected++;
        }
        else if (record.type == "capacity_violation") {
            metrics.capacity_violations++;
        }
        else if (record.type == "task_start") {
            metrics.tasks_started++;
            auto tid = get_string_field(record, "task_id");
            int64_t arrival = 0;
            if (auto iter = added_at.find(tid); iter != added_at.end()) {
                arrival = iter->second;
            }
            metrics.waiting_times_per_task[tid].push_back(record.time - arrival);
        }
        else if (record.type == "task_completion") {
            metrics.tasks_completed++;
            metrics.makespan = std::max(metrics.makespan, record.time);
        }
        else if (record.type == "deadline_met") {
            metrics.deadlines_met++;
        }
        else if (record.type == "deadline_missed") {
            metrics.deadlines_missed++;
            metrics.missed_tasks.push_back(get_string_field(record, "task_id"));
        }
    }

    if (capacity_total > 0) {
        metrics.average_utilization = static_cast<double>(used_total) / static_cast<double>(capacity_total);
    }

    return metrics;
}

std::vector<TraceRecord> parse_trace(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsArray()) {
        throw LoaderError("trace must be a JSON array", "trace");
    }

    std::vector<TraceRecord> traces;
    traces.reserve(doc.Size());

    for (rapidjson::SizeType idx = 0; idx < doc.Size(); ++idx) {
        const auto& obj = doc[idx];
        if (!obj.IsObject()) {
            throw LoaderError("trace record must be an object", "trace[" + std::to_string(idx) + "]");
        }
        TraceRecord record;

        if (obj.HasMember("time") && obj["time"].IsInt64()) {
            record.time = obj["time"].GetInt64();
        }
        if (obj.HasMember("type") && obj["type"].IsString()) {
            record.type = obj["type"].GetString();
        }

        // Extract all other fields
        for (auto iter = obj.MemberBegin(); iter != obj.MemberEnd(); ++iter) {
            std::string key = iter->name.GetString();
            if (key == "time" || key == "type") {
                continue;
            }
            if (iter->value.IsUint64()) {
                record.fields[key] = iter->value.GetUint64();
            } else if (iter->value.IsInt64()) {
                record.fields[key] = iter->value.GetInt64();
            } else if (iter->value.IsDouble()) {
                record.fields[key] = iter->value.GetDouble();
            } else if (iter->value.IsString()) {
                record.fields[key] = std::string(iter->value.GetString());
            }
        }

        traces.push_back(std::move(record));
    }

    return traces;
}

RunMetrics compute_metrics_from_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return compute_metrics(parse_trace(oss.str()));
}

} // namespace tasksched::io
