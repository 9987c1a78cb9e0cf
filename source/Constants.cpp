/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <droidflow/Constants.h>

namespace droidflow {
namespace constants {

const std::unordered_map<std::string, std::unordered_set<std::string>>&
get_intent_source_methods() {
  static const std::unordered_map<std::string, std::unordered_set<std::string>>
      intent_source_methods = {
          {"android.content.Intent",
           {"getStringExtra",
            "getIntExtra",
            "getBooleanExtra",
            "getData",
            "getDataString",
            "getExtras"}},
          {"android.os.Bundle", {"getString", "getInt", "getBoolean"}},
          {"android.net.Uri",
           {"getQueryParameter",
            "getLastPathSegment",
            "getPathSegments",
            "getHost",
            "getPath"}},
      };
  return intent_source_methods;
}

const std::vector<std::string>& get_webview_sink_patterns() {
  static const std::vector<std::string> webview_sink_patterns = {
      "loadUrl",
      "loadData",
      "loadDataWithBaseURL",
      "evaluateJavascript",
      "addJavascriptInterface",
      "setWebViewClient",
      "setWebChromeClient"};
  return webview_sink_patterns;
}

const std::vector<std::string>& get_file_sink_patterns() {
  static const std::vector<std::string> file_sink_patterns = {
      "FileOutputStream",
      "FileWriter",
      "RandomAccessFile.write",
      "Files.write"};
  return file_sink_patterns;
}

const std::vector<std::string>& get_network_sink_patterns() {
  static const std::vector<std::string> network_sink_patterns = {
      "HttpURLConnection",
      "OkHttp",
      "URLConnection.connect",
      "Socket.connect"};
  return network_sink_patterns;
}

const std::vector<std::string>& get_sql_sink_patterns() {
  static const std::vector<std::string> sql_sink_patterns = {
      "execSQL", "rawQuery", "SQLiteDatabase.query"};
  return sql_sink_patterns;
}

} // namespace constants
} // namespace droidflow
