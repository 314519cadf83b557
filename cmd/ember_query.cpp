// Copyright 2025 The Ember Authors
// SPDX-License-Identifier: Apache-2.0

#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <absl/strings/match.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>
#include <nlohmann/json.hpp>

#include <ember/core/common/status.hpp>
#include <ember/core/types/value_json.hpp>
#include <ember/db/query/query_evaluator.hpp>
#include <ember/db/service/document_service.hpp>
#include <ember/infra/cli/common.hpp>
#include <ember/infra/common/log.hpp>

using namespace ember;
using namespace ember::db;
using namespace ember::cmd::common;

namespace {

    //! Value typed on the command line: proto3 JSON object ({"integerValue": "5"}) or plain JSON literal
    Value parse_value(const std::string& text) {
        const auto json = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
        if (json.is_discarded()) {
            // Bare words are strings
            return Value::string(text);
        }
        if (json.is_object()) return json.get<Value>();
        if (json.is_boolean()) return Value::boolean(json.get<bool>());
        if (json.is_number_integer()) return Value::integer(json.get<int64_t>());
        if (json.is_number()) return Value::floating(json.get<double>());
        if (json.is_string()) return Value::string(json.get<std::string>());
        if (json.is_null()) return Value::null();
        throw StatusException{invalid_argument("unsupported value: " + text)};
    }

    //! Filter in "field op value" form, or "field is-null" style for unary operators
    query::Filter parse_filter(const std::string& text) {
        static const std::map<std::string, query::FieldOperator, std::less<>> kFieldOperators{
            {"<", query::FieldOperator::kLessThan},
            {"<=", query::FieldOperator::kLessThanOrEqual},
            {">", query::FieldOperator::kGreaterThan},
            {">=", query::FieldOperator::kGreaterThanOrEqual},
            {"==", query::FieldOperator::kEqual},
            {"!=", query::FieldOperator::kNotEqual},
            {"array-contains", query::FieldOperator::kArrayContains},
            {"in", query::FieldOperator::kIn},
            {"array-contains-any", query::FieldOperator::kArrayContainsAny},
            {"not-in", query::FieldOperator::kNotIn},
        };
        static const std::map<std::string, query::UnaryOperator, std::less<>> kUnaryOperators{
            {"is-nan", query::UnaryOperator::kIsNan},
            {"is-null", query::UnaryOperator::kIsNull},
            {"is-not-nan", query::UnaryOperator::kIsNotNan},
            {"is-not-null", query::UnaryOperator::kIsNotNull},
        };

        const std::vector<std::string> words = absl::StrSplit(text, absl::MaxSplits(' ', 2), absl::SkipWhitespace());
        if (words.size() == 2) {
            if (const auto it = kUnaryOperators.find(words[1]); it != kUnaryOperators.end()) {
                return query::unary_filter(words[0], it->second);
            }
        } else if (words.size() == 3) {
            if (const auto it = kFieldOperators.find(words[1]); it != kFieldOperators.end()) {
                return query::field_filter(words[0], it->second, parse_value(std::string{absl::StripAsciiWhitespace(words[2])}));
            }
        }
        throw StatusException{invalid_argument("invalid filter: " + text)};
    }

    query::Order parse_order(const std::string& text) {
        const std::vector<std::string> words = absl::StrSplit(text, ' ', absl::SkipWhitespace());
        if (words.empty() || words.size() > 2 || (words.size() == 2 && words[1] != "asc" && words[1] != "desc")) {
            throw StatusException{invalid_argument("invalid order: " + text)};
        }
        return query::Order{
            .field = unwrap_or_throw(FieldPath::parse(words[0])),
            .direction = words.size() == 2 && words[1] == "desc" ? query::Direction::kDescending
                                                                : query::Direction::kAscending,
        };
    }

    //! Documents of the fixture, names relative to the database root are made absolute
    std::vector<Document> load_fixture(const std::filesystem::path& path, const std::string& database) {
        std::ifstream input{path};
        if (!input) {
            throw StatusException{not_found("cannot open fixture " + path.string())};
        }
        const auto json = nlohmann::json::parse(input);
        if (!json.is_array()) {
            throw StatusException{invalid_argument("fixture must be an array of documents")};
        }
        std::vector<Document> documents;
        documents.reserve(json.size());
        for (const auto& item : json) {
            auto document = item.get<Document>();
            if (!absl::StartsWith(document.name, "projects/")) {
                document.name = database + "/documents/" + document.name;
            }
            documents.push_back(std::move(document));
        }
        return documents;
    }

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"Run a structured query over documents loaded from a JSON fixture"};

    std::filesystem::path fixture;
    std::string database{"projects/demo/databases/(default)"};
    std::string parent;
    std::string collection;
    bool all_descendants{false};
    std::vector<std::string> filters;
    std::vector<std::string> orders;
    std::vector<std::string> fields;
    int64_t offset{0};
    std::optional<int64_t> limit;
    bool pretty{false};
    bool count{false};
    std::vector<std::string> sums;
    std::vector<std::string> averages;

    add_option_fixture(app, fixture, /*is_required=*/true);
    add_option_database(app, database);
    app.add_option("--parent", parent, "Parent document path relative to the database root (default: the root)");
    app.add_option("--collection", collection, "Collection id to query")->required();
    app.add_flag("--all-descendants", all_descendants, "Query every collection with this id below the parent");
    app.add_option("--where", filters, "Filter, e.g. \"population >= 100000\" or \"capital is-not-null\"");
    app.add_option("--order-by", orders, "Order clause, e.g. \"population desc\"");
    app.add_option("--select", fields, "Fields to return");
    app.add_option("--offset", offset, "Results to skip")->capture_default_str()->check(CLI::NonNegativeNumber);
    app.add_option("--limit", limit, "Maximum number of results")->check(CLI::NonNegativeNumber);
    app.add_flag("--pretty", pretty, "Indent the JSON output");
    app.add_flag("--count", count, "Print the number of results instead of the results");
    app.add_option("--sum", sums, "Print the sum of a numeric field over the results");
    app.add_option("--avg", averages, "Print the average of a numeric field over the results");
    log::Settings log_settings{};
    add_logging_options(app, log_settings);

    CLI11_PARSE(app, argc, argv)

    log::init(log_settings);

    try {
        service::DocumentService documents;
        const auto imported = unwrap_or_throw(documents.import_documents(load_fixture(fixture, database)));
        EMBER_INFO << "Fixture loaded" << log::Args{"file", fixture.string(), "commit_time", imported.commit_time.to_string(),
                                                   "documents", std::to_string(imported.write_results.size())};

        query::StructuredQuery structured;
        structured.from.push_back({.collection_id = collection, .all_descendants = all_descendants});
        if (filters.size() == 1) {
            structured.where = parse_filter(filters.front());
        } else if (filters.size() > 1) {
            std::vector<query::Filter> conjunction;
            for (const auto& filter : filters) conjunction.push_back(parse_filter(filter));
            structured.where = query::and_filter(std::move(conjunction));
        }
        for (const auto& order : orders) structured.order_by.push_back(parse_order(order));
        if (!fields.empty()) {
            DocumentMask mask;
            for (const auto& field : fields) mask.field_paths.push_back(unwrap_or_throw(FieldPath::parse(field)));
            structured.select = std::move(mask);
        }
        structured.offset = offset;
        structured.limit = limit;
        EMBER_DEBUG << "Running query" << log::Args{"query", [&] {
                           std::ostringstream out;
                           out << structured;
                           return out.str();
                       }()};

        const std::string root = database + "/documents";
        if (count || !sums.empty() || !averages.empty()) {
            std::vector<query::Aggregation> aggregations;
            if (count) aggregations.push_back(query::Aggregation::count("count"));
            for (const auto& field : sums) {
                aggregations.push_back(query::Aggregation::sum("sum_" + field, unwrap_or_throw(FieldPath::parse(field))));
            }
            for (const auto& field : averages) {
                aggregations.push_back(query::Aggregation::avg("avg_" + field, unwrap_or_throw(FieldPath::parse(field))));
            }
            const auto response = unwrap_or_throw(documents.run_aggregation_query({
                .parent = parent.empty() ? root : root + "/" + parent,
                .structured_query = std::move(structured),
                .aggregations = std::move(aggregations),
            }));
            std::cout << nlohmann::json(response.result).dump(pretty ? 2 : -1) << "\n";
            EMBER_INFO << "Aggregation completed" << log::Args{"read_time", response.read_time.to_string()};
            return 0;
        }
        auto stream = unwrap_or_throw(documents.run_query({
            .parent = parent.empty() ? root : root + "/" + parent,
            .structured_query = std::move(structured),
        }));
        query::QueryResultMerger merger;
        while (auto response = stream.next()) {
            merger.add(*response);
        }

        nlohmann::json output = nlohmann::json::array();
        for (const auto& document : merger.documents()) {
            output.push_back(nlohmann::json(document));
        }
        std::cout << output.dump(pretty ? 2 : -1) << "\n";
        EMBER_INFO << "Query completed" << log::Args{"results", std::to_string(merger.documents().size()), "skipped",
                                                    std::to_string(merger.skipped_results()), "read_time",
                                                    merger.read_time().to_string()};
    } catch (const StatusException& ex) {
        EMBER_ERROR << "Query failed" << log::Args{"status", ex.status().to_string()};
        return -1;
    } catch (const std::exception& ex) {
        EMBER_ERROR << "Unexpected error" << log::Args{"what", ex.what()};
        return -1;
    }
    return 0;
}
