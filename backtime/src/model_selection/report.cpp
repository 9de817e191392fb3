#include "backtime/model_selection/report.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <tuple>

namespace backtime::model_selection {
namespace {

void writeValue(std::ostream &out, double value) {
	if (std::isnan(value)) {
		return;
	}
	std::ostringstream formatted;
	formatted << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
	out << formatted.str();
}

// Quotes a field when it would otherwise break the row.
std::string escape(const std::string &field) {
	if (field.find_first_of(",\"\n") == std::string::npos) {
		return field;
	}
	std::string quoted = "\"";
	for (char c : field) {
		if (c == '"') {
			quoted += '"';
		}
		quoted += c;
	}
	quoted += '"';
	return quoted;
}

} // namespace

ForecastTable buildForecastTable(const FoldResults &folds) {
	ForecastTable table;
	for (const auto &entry : folds) {
		const auto &forecast = entry.second.forecast;
		for (const auto &segment : forecast.segments()) {
			const auto &target = forecast.column(segment);
			for (std::size_t i = 0; i < forecast.size(); ++i) {
				table.push_back(ForecastRow {forecast.index()[i], segment, target[i], entry.first});
			}
		}
	}
	return table;
}

MetricsTable buildMetricsTable(const FoldResults &folds, const std::vector<std::string> &metric_names,
                               bool aggregate) {
	MetricsTable table;
	table.metric_names = metric_names;

	for (const auto &entry : folds) {
		std::map<std::string, MetricsRow> by_segment;
		for (const auto &name : metric_names) {
			const auto metric = entry.second.metrics.find(name);
			if (metric == entry.second.metrics.end()) {
				continue;
			}
			for (const auto &value : metric->second) {
				auto &row = by_segment[value.first];
				row.segment = value.first;
				row.fold_number = entry.first;
				row.values[name] = value.second;
			}
		}
		for (auto &row : by_segment) {
			table.rows.push_back(std::move(row.second));
		}
	}

	std::stable_sort(table.rows.begin(), table.rows.end(), [](const MetricsRow &lhs, const MetricsRow &rhs) {
		return std::tie(lhs.segment, lhs.fold_number) < std::tie(rhs.segment, rhs.fold_number);
	});

	if (!aggregate) {
		return table;
	}

	std::vector<MetricsRow> aggregated;
	for (auto first = table.rows.begin(); first != table.rows.end();) {
		const auto last = std::find_if(first, table.rows.end(),
		                               [&](const MetricsRow &row) { return row.segment != first->segment; });
		MetricsRow row;
		row.segment = first->segment;
		for (const auto &name : metric_names) {
			double sum = 0.0;
			std::size_t count = 0;
			for (auto it = first; it != last; ++it) {
				const auto value = it->values.find(name);
				if (value != it->values.end() && !std::isnan(value->second)) {
					sum += value->second;
					++count;
				}
			}
			row.values[name] = count == 0 ? std::numeric_limits<double>::quiet_NaN() : sum / count;
		}
		aggregated.push_back(std::move(row));
		first = last;
	}
	table.rows = std::move(aggregated);
	return table;
}

FoldInfoTable buildFoldInfoTable(const FoldResults &folds) {
	FoldInfoTable table;
	table.reserve(folds.size());
	for (const auto &entry : folds) {
		const auto &fold = entry.second;
		table.push_back(FoldInfoRow {fold.train_timerange.start, fold.train_timerange.end,
		                             fold.test_timerange.start, fold.test_timerange.end, entry.first});
	}
	return table;
}

namespace {

bool safeGmTime(std::time_t seconds, std::tm &out) {
#if defined(_WIN32)
	return gmtime_s(&out, &seconds) == 0;
#elif defined(__unix__) || defined(__APPLE__)
	return gmtime_r(&seconds, &out) != nullptr;
#else
	const std::tm *result = std::gmtime(&seconds);
	if (!result) {
		return false;
	}
	out = *result;
	return true;
#endif
}

} // namespace

std::string formatTimestamp(core::Dataset::TimePoint timestamp) {
	const std::time_t seconds = std::chrono::system_clock::to_time_t(timestamp);
	std::tm utc {};
	if (!safeGmTime(seconds, utc)) {
		throw std::out_of_range("Timestamp cannot be represented as a UTC calendar time.");
	}
	std::ostringstream out;
	out << std::put_time(&utc, "%Y-%m-%d %H:%M:%S");
	return out.str();
}

void writeCsv(std::ostream &out, const ForecastTable &table) {
	out << "timestamp,segment,target,fold_number\n";
	for (const auto &row : table) {
		out << formatTimestamp(row.timestamp) << ',' << escape(row.segment) << ',';
		writeValue(out, row.target);
		out << ',' << row.fold_number << '\n';
	}
}

void writeCsv(std::ostream &out, const MetricsTable &table) {
	const bool with_folds =
	    std::any_of(table.rows.begin(), table.rows.end(), [](const MetricsRow &row) { return row.fold_number.has_value(); });

	out << "segment";
	for (const auto &name : table.metric_names) {
		out << ',' << escape(name);
	}
	if (with_folds) {
		out << ",fold_number";
	}
	out << '\n';

	for (const auto &row : table.rows) {
		out << escape(row.segment);
		for (const auto &name : table.metric_names) {
			out << ',';
			const auto value = row.values.find(name);
			if (value != row.values.end()) {
				writeValue(out, value->second);
			}
		}
		if (with_folds) {
			out << ',';
			if (row.fold_number) {
				out << *row.fold_number;
			}
		}
		out << '\n';
	}
}

void writeCsv(std::ostream &out, const FoldInfoTable &table) {
	out << "train_start_time,train_end_time,test_start_time,test_end_time,fold_number\n";
	for (const auto &row : table) {
		out << formatTimestamp(row.train_start_time) << ',' << formatTimestamp(row.train_end_time) << ','
		    << formatTimestamp(row.test_start_time) << ',' << formatTimestamp(row.test_end_time) << ','
		    << row.fold_number << '\n';
	}
}

} // namespace backtime::model_selection
