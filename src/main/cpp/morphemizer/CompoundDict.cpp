/**
 * @author  Jamie (jamie.lim@kakaocorp.com)
 * @copyright  Copyright (C) 2018-, Kakao Corp. All rights reserved.
 */


#include "morphemizer/CompoundDict.hpp"

/** Supports spdlog::stderr_color_mt */
#include <spdlog/sinks/stdout_color_sinks.h>


//////////////
// includes //
//////////////
#include <algorithm>
#include <fstream>
#include <iterator>
#include <unordered_set>
#include <utility>

#include "fmt/format.h"

#include "morphemizer/MorphemizerApi.hpp"
#include "morphemizer/util.hpp"


namespace morphemizer {


using std::ifstream;
using std::istreambuf_iterator;
using std::pair;
using std::shared_ptr;
using std::string;
using std::unordered_set;
using std::vector;


////////////////////
// static members //
////////////////////
const char* const CompoundDict::STUDY_PLAN_HEADER = "#study_plan_frequency";
const char CompoundDict::JOINER;

shared_ptr<spdlog::logger> CompoundDict::_log = spdlog::stderr_color_mt("CompoundDict");


///////////////
// functions //
///////////////
namespace {

const char _UTF8_BOM[] = "\xEF\xBB\xBF";

/**
 * read a field of tab separated values. a field starting with double quote is unquoted and
 * may contain tabs and newlines
 * @param  content  text with '\n' newlines
 * @param  pos  [in/out] start of the field. moved to the delimiter (or end) after the field
 * @return  field
 */
string _read_field(const string& content, size_t* pos) {
    string field;
    size_t idx = *pos;
    if (idx < content.length() && content[idx] == '"') {
        for (++idx; idx < content.length(); ++idx) {
            if (content[idx] != '"') {
                field += content[idx];
            } else if (idx + 1 < content.length() && content[idx + 1] == '"') {
                field += '"';
                ++idx;
            } else {
                ++idx;
                break;
            }
        }
    }
    // text between closing quote and the delimiter belongs to the field
    size_t end = std::min(content.find_first_of("\t\n", idx), content.length());
    field.append(content, idx, end - idx);
    *pos = end;
    return field;
}


/**
 * read a row and return its first column
 * @param  content  text with '\n' newlines
 * @param  pos  [in/out] start of the row. moved to the start of the next row
 * @param  first  [out] first column
 * @return  false if the row is blank
 */
bool _read_row(const string& content, size_t* pos, string* first) {
    if (*pos >= content.length() || content[*pos] == '\n') {
        ++*pos;
        return false;
    }
    *first = _read_field(content, pos);
    while (*pos < content.length() && content[*pos] == '\t') {
        ++*pos;
        _read_field(content, pos);
    }
    ++*pos;    // newline
    return true;
}


/**
 * "\r\n" and "\r" into "\n"
 */
void _normalize_newlines(string* content) {
    replace_all(content, "\r\n", "\n");
    std::replace(content->begin(), content->end(), '\r', '\n');
}

}    // namespace


/////////////
// methods //
/////////////
bool CompoundDict::open(const string& path) {
    close();

    ifstream ifs(path, std::ios::binary);
    if (!ifs.good()) throw Except(fmt::format("frequency list not found: {}", path));
    string content((istreambuf_iterator<char>(ifs)), istreambuf_iterator<char>());
    if (ifs.bad()) throw Except(fmt::format("fail to read frequency list: {}", path));
    if (content.compare(0, sizeof(_UTF8_BOM) - 1, _UTF8_BOM) == 0) {
        content.erase(0, sizeof(_UTF8_BOM) - 1);
    }
    _normalize_newlines(&content);
    if (!content.empty() && content.back() == '\n') content.pop_back();
    if (content.empty()) throw Except(fmt::format("frequency list is empty: {}", path));

    vector<string> phrases;
    int row_num = 0;
    for (size_t pos = 0; pos <= content.length(); ) {
        ++row_num;
        string first;
        if (!_read_row(content, &pos, &first)) {
            throw Except(fmt::format("no column in row {} of frequency list: {}", row_num, path));
        }
        phrases.emplace_back(std::move(first));
        if (row_num == 1 && phrases[0] == STUDY_PLAN_HEADER) {
            _log->info("study plan is not a frequency list: {}", path);
            return false;
        }
    }

    set_words(phrases);
    _log->info("{} compound words loaded from {} entries: {}", _words.size(), phrases.size(), path);
    return true;
}


void CompoundDict::close() {
    _words.clear();
    _joined.clear();
}


void CompoundDict::set_words(const vector<string>& phrases) {
    close();

    unordered_set<string> seen;
    vector<pair<size_t, string>> compounds;    // (length in characters, phrase)
    for (const auto& phrase : phrases) {
        if (!seen.insert(phrase).second) continue;
        if (phrase.find(' ') == string::npos) continue;
        compounds.emplace_back(utf8_to_wstr(phrase).length(), phrase);
    }
    // longest first. equal lengths are in reverse order of the list
    std::stable_sort(compounds.begin(), compounds.end(),
                     [](const pair<size_t, string>& left, const pair<size_t, string>& right) {
                         return left.first < right.first;
                     });
    std::reverse(compounds.begin(), compounds.end());

    for (auto& compound : compounds) {
        string joined(compound.second);
        std::replace(joined.begin(), joined.end(), ' ', JOINER);
        _words.emplace_back(std::move(compound.second));
        _joined.emplace_back(std::move(joined));
    }
}


}    // namespace morphemizer
