// Copyright 2026 The msgvariant Authors
//
// msgvariant_demo -- render a stored translation value from the command line.
//
//   msgvariant_demo [--locale=TAG] [--forms] VALUE [name=value ...]
//
// Parameter values that parse as numbers are passed as numbers, "true" and
// "false" as booleans, everything else as strings.  With no VALUE a few
// built-in messages are rendered instead.

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "msgvariant/msgvariant.hpp"

namespace {

const char kItems[] =
    R"([{"declarations":["input count","local countPlural = count: plural"],)"
    R"("selectors":["countPlural"],)"
    R"("match":{"countPlural=one":"{count} item","countPlural=other":"{count} items"}}])";

const char kPlaces[] =
    R"([{"declarations":["input place","local ord = place: plural type=ordinal"],)"
    R"("match":{"ord=one":"{place}st place","ord=two":"{place}nd place",)"
    R"("ord=few":"{place}rd place","ord=*":"{place}th place"}}])";

void SetParam(msgvariant::Params* params, const std::string& arg) {
  size_t eq = arg.find('=');
  if (eq == std::string::npos || eq == 0) {
    std::fprintf(stderr, "ignoring argument '%s' (expected name=value)\n",
                 arg.c_str());
    return;
  }
  std::string name = arg.substr(0, eq);
  std::string value = arg.substr(eq + 1);

  if (value == "true" || value == "false") {
    params->Set(name, value == "true");
    return;
  }
  char* end = nullptr;
  double number = std::strtod(value.c_str(), &end);
  if (!value.empty() && end == value.c_str() + value.size()) {
    params->Set(name, number);
  } else {
    params->Set(name, value);
  }
}

int RunShowcase(msgvariant::Context& ctx) {
  for (int count : {0, 1, 2, 21}) {
    msgvariant::Params params;
    params.Set("count", count);
    std::printf("%-4d %s\n", count, ctx.Render(kItems, params).c_str());
  }
  for (int place : {1, 2, 3, 4, 11, 22}) {
    msgvariant::Params params;
    params.Set("place", place);
    std::printf("%-4d %-12s [%s]\n", place,
                ctx.Render(kPlaces, params).c_str(),
                ctx.DetectActiveKey(kPlaces, params).c_str());
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::string locale;
  bool list_forms = false;
  std::string value;
  msgvariant::Params params;
  bool have_value = false;

  for (int i = 1; i < argc; ++i) {
    if (std::strncmp(argv[i], "--locale=", 9) == 0) {
      locale = argv[i] + 9;
    } else if (std::strcmp(argv[i], "--forms") == 0) {
      list_forms = true;
    } else if (!have_value) {
      value = argv[i];
      have_value = true;
    } else {
      SetParam(&params, argv[i]);
    }
  }

  try {
    msgvariant::Context ctx;
    if (!locale.empty()) ctx.set_default_locale(locale);

    if (!have_value) return RunShowcase(ctx);

    std::printf("%s\n", ctx.Render(value, params).c_str());

    if (msgvariant::is_variant(value)) {
      std::printf("active: %s\n", ctx.DetectActiveKey(value, params).c_str());
      if (list_forms) {
        for (const auto& key : ctx.FormKeys(value)) {
          std::printf("  %s => %s\n", key.c_str(),
                      ctx.FormTemplate(value, key).c_str());
        }
      }
    }
  } catch (const msgvariant::Error& e) {
    std::fprintf(stderr, "msgvariant error %d: %s\n",
                 static_cast<int>(e.code()), e.what());
    return 1;
  }
  return 0;
}
