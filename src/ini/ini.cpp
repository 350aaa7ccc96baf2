#include "dheap/ini.h"

#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include "dheap/utils/sv.h"

namespace dheap {

using utils::ltrim;
using utils::rtrim;
using utils::trim;

INI::Section::operator std::string() const {
  std::stringstream ss;
  ss << "[" << name_ << "]\n";
  for (auto &[key, val] : *this) ss << key << "=" << val << "\n";
  return ss.str();
}

INI INI::parse(std::string_view content, CommentType type) {
  INI obj;
  INI::KeyValues *p_sec = nullptr;
  size_t line_no = 0;

  for (std::string_view line; !content.empty();) {
    utils::getline(content, line, '\n');
    ++line_no;
    line = trim(line);
    if (line.empty() || is_comment_line(line, type)) {
      continue;
    } else if (line[0] == '[') {
      // section name
      if (line.back() != ']')
        throw std::invalid_argument("INI: line " + std::to_string(line_no) +
                                    ": there is no ] in section name");
      auto sec_name = std::string(trim(line.substr(1, line.size() - 2)));
      // a repeated section continues the former one
      obj.add(sec_name);
      p_sec = &obj.data_[sec_name];
    } else {
      if (auto pos = line.find('='); pos == std::string_view::npos)
        throw std::invalid_argument("INI: line " + std::to_string(line_no) +
                                    ": there is no = in the key-value pair");
      else if (p_sec == nullptr)
        throw std::invalid_argument("INI: line " + std::to_string(line_no) +
                                    ": the key-value pair has no section");
      else {
        auto name = std::string(rtrim(line.substr(0, pos))),
             value = std::string(ltrim(line.substr(pos + 1)));
        (*p_sec)[std::move(name)] = std::move(value);
      }
    }
  }
  return obj;
}

INI INI::parse(std::istream &is, CommentType type) {
  std::string str((std::istreambuf_iterator<char>(is)),
                  std::istreambuf_iterator<char>());
  return parse(std::string_view(str), type);
}

INI INI::load(const std::string &path, CommentType type) {
  std::ifstream fs(path);
  if (!fs.is_open()) throw std::runtime_error("INI: can't open " + path);
  return parse(fs, type);
}

INI::operator std::string() const {
  std::stringstream ss;
  for (const auto &[name, sec] : data_) {
    ss << '[' << name << "]\n";
    for (const auto &[key, value] : sec) ss << key << '=' << value << '\n';
    ss << '\n';
  }
  return ss.str();
}

bool INI::add(const std::string &section_name) {
  if (section_name.empty()) return false;
  return data_.try_emplace(section_name).second;
}

bool INI::remove(const std::string &section_name) {
  return data_.erase(section_name) > 0;
}

void INI::update(const std::string &section_name,
                 const INI::KeyValues &keyvalues) {
  auto &sec = data_[section_name];
  for (const auto &[key, value] : keyvalues) sec[key] = value;
}

void INI::update(const Section &section) { update(section.name(), section); }

bool INI::rename(const std::string &section_name,
                 const std::string &new_section_name) {
  auto it = data_.find(section_name);
  if (it == data_.end() || has(new_section_name)) return false;

  auto nh = data_.extract(it);
  nh.key() = new_section_name;
  data_.insert(std::move(nh));
  return true;
}

void INI::set(const std::string &section_name, const std::string &key,
              const std::string &value) {
  // the section is created if it doesn't exist
  data_[section_name][key] = value;
}

bool INI::remove(const std::string &section_name, const std::string &key) {
  auto it_sec = data_.find(section_name);
  if (it_sec == data_.end()) return false;
  return it_sec->second.erase(key) > 0;
}

bool INI::rename(const std::string &section_name, const std::string &key,
                 const std::string &new_key) {
  auto it_sec = data_.find(section_name);
  if (it_sec == data_.end()) return false;
  auto &sec = it_sec->second;
  auto it_val = sec.find(key);
  if (it_val == sec.end() || sec.count(new_key)) return false;
  auto nh = sec.extract(it_val);
  nh.key() = new_key;
  sec.insert(std::move(nh));
  return true;
}

bool INI::has(const std::string &section_name, const std::string &key) const {
  if (auto it_sec = data_.find(section_name); it_sec == data_.end())
    return false;
  else
    return it_sec->second.count(key);
}

std::string INI::get(const std::string &section_name, const std::string &key,
                     const std::string &default_value) const {
  if (auto it_sec = data_.find(section_name); it_sec == data_.end())
    return default_value;
  else {
    auto &sec = it_sec->second;
    if (auto it_val = sec.find(key); it_val == sec.end())
      return default_value;
    else
      return it_val->second;
  }
}

}  // namespace dheap
