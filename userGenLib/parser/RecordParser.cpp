#include <usergen/io/TextFileReader.hpp>
#include <usergen/login/LoginGenerator.hpp>
#include <usergen/parser/RecordParser.hpp>
#include <usergen/util/textFormatUtil.hpp>

namespace UserGen {

LineStatus parseLine(const std::string& line, PersonRecord& out) {
    const std::string trimmed = util::trim(line);
    if (trimmed.empty())
        return LineStatus::Blank;

    std::vector<std::string> parts = util::splitFields(trimmed);
    if (parts.size() < kMinFieldCount)
        return LineStatus::TooFewFields;

    if (!util::isAllDigits(parts[0]))
        return LineStatus::NonNumericId;

    std::string middle;
    std::string surname;
    std::string department;
    if (parts.size() == kMinFieldCount) {
        surname = parts[2];
        department = parts[3];
    } else {
        middle = parts[2];
        surname = parts[3];
        department = util::joinFields(parts, 4);
    }

    // pieces are already trimmed
    if (surname.empty())
        return LineStatus::MissingSurname;

    out = PersonRecord(std::move(parts[0]), std::move(parts[1]), std::move(middle),
                       std::move(surname), std::move(department));
    return LineStatus::Accepted;
}

FileParseResult parseFile(const std::string& path, LoginRegistry& registry) {
    FileParseResult result;
    result.path = path;

    std::vector<std::string> lines;
    {
        TextFileReader reader(path, result.ec);
        if (result.ec)
            return result;
        if (!reader.readLines(lines, result.ec))
            return result;
        if (!reader.close(result.ec))
            return result;
    }

    for (size_t i = 0; i < lines.size(); ++i) {
        PersonRecord person;
        LineStatus status = parseLine(lines[i], person);

        if (status == LineStatus::NonNumericId) {
            std::string trimmed = util::trim(lines[i]);
            LineWarning w;
            w.lineNumber = i + 1;
            w.id = util::trim(trimmed.substr(0, trimmed.find(util::kFieldSeparator)));
            w.line = std::move(trimmed);
            result.warnings.push_back(std::move(w));
            continue;
        }
        if (status != LineStatus::Accepted)
            continue;

        std::string login = createLoginName(person.givenName(), person.middleName(),
                                            person.surname(), registry);
        result.records.emplace_back(std::move(person), std::move(login));
    }
    return result;
}

void reportDiagnostics(const FileParseResult& result, std::ostream& err) {
    for (const auto& w : result.warnings) {
        err << "[Warning] Invalid non-numeric ID '" << w.id << "' in line: " << w.line
            << ". Skipping...\n";
    }
    if (result.ec) {
        err << "[Error] Unexpected error reading " << result.path << ": " << result.ec.message()
            << "\n";
    }
}

std::vector<AccountRecord> readInputFiles(const std::vector<std::string>& paths,
                                          LoginRegistry& registry, std::ostream& err) {
    std::vector<AccountRecord> combined;
    for (const auto& path : paths) {
        FileParseResult result = parseFile(path, registry);
        reportDiagnostics(result, err);
        for (auto& r : result.records)
            combined.push_back(std::move(r));
    }
    return combined;
}

} // namespace UserGen
