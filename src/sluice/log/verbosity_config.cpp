/* Sluice
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "sluice/log/verbosity_config.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <cassert>

namespace sluice::log
{

// Static initializations.

const std::string Verbosity_config::S_ALL_MODULE_NAME_ALIAS("ALL");
const char Verbosity_config::S_TOKEN_SEPARATOR(';');
const char Verbosity_config::S_PAIR_SEPARATOR(':');
const char Verbosity_config::S_MODULE_SEGMENT_SEPARATOR('.');
const Level Verbosity_config::S_MOST_VERBOSE_LEVEL_DEFAULT(Level::S_INFO);

// Implementations.

Verbosity_config::Verbosity_config()
{
  using std::string;
  using std::make_pair;

  // As promised:
  m_module_level_pairs.push_back(make_pair(string(), S_MOST_VERBOSE_LEVEL_DEFAULT));
  index_pairs();
}

bool Verbosity_config::parse(std::istream& is)
{
  using util::ostream_op_string;
  using boost::algorithm::split;
  using boost::algorithm::is_any_of;
  using boost::algorithm::to_upper_copy;
  using boost::lexical_cast;
  using boost::bad_lexical_cast;
  using std::vector;
  using std::string;
  using std::make_pair;
  using std::locale;

  string tokens_str;
  is >> tokens_str; // As promised read up to (not including) first space.

  Module_level_pair_seq result_pairs;

  // Everything below follows directly from the doc header of parse().

  if (!tokens_str.empty()) // Degenerate case.
  {
    vector<string> tokens;
    split(tokens, tokens_str, is_any_of(string(1, S_TOKEN_SEPARATOR)));
    result_pairs.reserve(tokens.size()); // Little optimization.

    const auto is_pair_sep = is_any_of(string(1, S_PAIR_SEPARATOR));
    for (const auto& token : tokens)
    {
      if (token.empty()) // Trying to split "" may still produce non-empty leaf_tokens... just eliminate corner case.
      {
        m_last_result_message = ostream_op_string("A pair token is empty in [", tokens_str, "].");
        return false;
      }
      // else

      vector<string> leaf_tokens;
      split(leaf_tokens, token, is_pair_sep);

      if (leaf_tokens.empty() || (leaf_tokens.size() > 2))
      {
        m_last_result_message = ostream_op_string("Pair token [", token,
                                                  "] in [", tokens_str, "] must contain 1-2 `", S_PAIR_SEPARATOR,
                                                  "`-separated leaf tokens: `<module>",
                                                  S_PAIR_SEPARATOR, "<level>` or `",
                                                  S_ALL_MODULE_NAME_ALIAS, S_PAIR_SEPARATOR,
                                                  "<level>` or `", S_PAIR_SEPARATOR, "<level>` or just `<level>`.");
        return false;
      }
      // else

      if (leaf_tokens.size() == 1) // "level" treated as-if ":level".
      {
        leaf_tokens.insert(leaf_tokens.begin(), "");
      }

      // Store the module name upper-cased; then ostream<< output will match S_ALL_MODULE_NAME_ALIAS.
      assert(leaf_tokens.size() == 2);
      auto module = to_upper_copy(leaf_tokens[0], locale::classic());
      if (module == S_ALL_MODULE_NAME_ALIAS) // "ALL:level" treated as-if ":level".
      {
        module.clear();
      }

      Level level;
      try
      {
        /* Level>>istream is permissive -- anything matching [A-Za-z0-9_]* is accepted -- but if leaf_tokens[1] is
         * that followed by junk (say they wrote WARNING,INFO by mistake), operator>> stops at the comma and leaves
         * stuff in the istream; lexical_cast<> then throws bad_lexical_cast.  So catch it. */
        level = lexical_cast<Level>(leaf_tokens[1]);
      }
      catch (const bad_lexical_cast&)
      {
        m_last_result_message = ostream_op_string("Leaf token [", leaf_tokens[1],
                                                  "] in [", tokens_str, "] must contain a level composed of "
                                                  "alphanumerics and underscores but appears to contain other "
                                                  "characters.");
        return false;
      }

      // Level>>istream yields NONE for anything unrecognized; accept NONE only if they actually said so.
      if ((level == Level::S_NONE)
          && (to_upper_copy(leaf_tokens[1], locale::classic()) != ostream_op_string(Level::S_NONE))
          && (leaf_tokens[1] != ostream_op_string(static_cast<size_t>(Level::S_NONE))))
      {
        m_last_result_message = ostream_op_string("Leaf token [", leaf_tokens[1],
                                                  "] in [", tokens_str, "] is not a known level.");
        return false;
      }
      // else

      result_pairs.push_back(make_pair(std::move(module), level));
    } // for (token : tokens)
  } // if (!tokens_str.empty())
  // else if (tokens_str.empty()) { No problem: we handle result_pairs.empty() just below. }

  // As promised there must be a leading default-verbosity pair.
  if (result_pairs.empty() || (!result_pairs.front().first.empty()))
  {
    result_pairs.insert(result_pairs.begin(), make_pair(string(), S_MOST_VERBOSE_LEVEL_DEFAULT));
  }

  // Finalize only if all succeeded only (as promised).
  m_module_level_pairs = std::move(result_pairs);
  // result_pairs is now hosed.
  index_pairs();

  m_last_result_message.clear();
  return true;
} // Verbosity_config::parse()

void Verbosity_config::index_pairs()
{
  m_level_by_module.clear();
  for (const auto& pair : m_module_level_pairs)
  {
    m_level_by_module[pair.first] = pair.second; // Later pairs override earlier ones.
  }
  assert(m_level_by_module.count(std::string()) == 1);
}

Level Verbosity_config::module_level(util::String_view module) const
{
  using boost::algorithm::to_upper_copy;
  using std::string;
  using std::locale;

  // Try the module itself; then each shorter dotted prefix of it.
  string name = to_upper_copy(string(module), locale::classic());
  while (!name.empty())
  {
    const auto it = m_level_by_module.find(name);
    if (it != m_level_by_module.end())
    {
      return it->second;
    }
    // else

    const auto sep_pos = name.rfind(S_MODULE_SEGMENT_SEPARATOR);
    if (sep_pos == string::npos)
    {
      name.clear();
    }
    else
    {
      name.erase(sep_pos);
    }
  }

  // Now name is "": the default, which is always present.
  const auto it = m_level_by_module.find(name);
  assert(it != m_level_by_module.end());
  return it->second;
} // Verbosity_config::module_level()

const std::string& Verbosity_config::last_result_message() const
{
  return m_last_result_message;
}

const Verbosity_config::Module_level_pair_seq& Verbosity_config::module_level_pairs() const
{
  return m_module_level_pairs;
}

boost::shared_ptr<Filter_drain> make_verbosity_filter(const Verbosity_config& cfg, Drain::Ptr inner)
{
  const boost::shared_ptr<const Verbosity_config> cfg_copy = boost::make_shared<Verbosity_config>(cfg);
  return boost::make_shared<Filter_drain>([cfg_copy](const Record& record) -> bool
  {
    return level_passes(record.m_level, cfg_copy->module_level(record.m_module));
  }, std::move(inner));
}

std::istream& operator>>(std::istream& is, Verbosity_config& val)
{
  val.parse(is);
  return is;
}

std::ostream& operator<<(std::ostream& os, const Verbosity_config& val)
{
  const auto& module_level_pairs = val.module_level_pairs();
  for (size_t idx = 0; idx != module_level_pairs.size(); ++idx)
  {
    const auto& pair = module_level_pairs[idx];
    const auto& module_name = pair.first;

    os << (module_name.empty() ? Verbosity_config::S_ALL_MODULE_NAME_ALIAS : module_name);
    os << Verbosity_config::S_PAIR_SEPARATOR;
    os << pair.second;

    if (idx != (module_level_pairs.size() - 1))
    {
      os << Verbosity_config::S_TOKEN_SEPARATOR;
    }
  }

  return os;
}

bool operator==(const Verbosity_config& val1, const Verbosity_config& val2)
{
  return val1.module_level_pairs() == val2.module_level_pairs();
}

bool operator!=(const Verbosity_config& val1, const Verbosity_config& val2)
{
  return !(operator==(val1, val2));
}

} // namespace sluice::log
