#pragma once

#include <string_view>

namespace fixtures {

inline constexpr std::string_view novel_outline = R"json({
  "title": "逆世修仙",
  "genre": "都市玄幻",
  "characters": [
    {
      "name": "林凡",
      "type": "male_lead",
      "description": "被逐出家族的少年"
    },
    {
      "name": "苏婉",
      "type": "female_lead",
      "description": "神秘的药师"
    }
  ],
  "setting": {
    "core_setting_summary": "南京城中隐藏着修仙世界",
    "key_locations": ["南京眼", "紫金山"]
  }
})json";

/// Adds a character and two setting fields, wrapped the way a chat model answers
inline constexpr std::string_view novel_outline_diff = R"diff(Here are the changes:
```diff
--- a/document.json
+++ b/document.json
@@ -12,4 +12,9 @@
       "type": "female_lead",
       "description": "神秘的药师"
-    }
+    },
+    {
+      "name": "弗利沙沙",
+      "type": "final_antagonist",
+      "description": "来自外星的征服者"
+    }
   ],
@@ -17,3 +22,5 @@
     "core_setting_summary": "南京城中隐藏着修仙世界",
-    "key_locations": ["南京眼", "紫金山"]
+    "key_locations": ["南京眼", "紫金山"],
+    "key_scenes": ["南京眼摩天轮顶层密室"],
+    "climactic_moment": "紫金山之巅的最终决战"
   }
```
)diff";

inline constexpr std::string_view novel_outline_patched = R"json({
  "title": "逆世修仙",
  "genre": "都市玄幻",
  "characters": [
    {
      "name": "林凡",
      "type": "male_lead",
      "description": "被逐出家族的少年"
    },
    {
      "name": "苏婉",
      "type": "female_lead",
      "description": "神秘的药师"
    },
    {
      "name": "弗利沙沙",
      "type": "final_antagonist",
      "description": "来自外星的征服者"
    }
  ],
  "setting": {
    "core_setting_summary": "南京城中隐藏着修仙世界",
    "key_locations": ["南京眼", "紫金山"],
    "key_scenes": ["南京眼摩天轮顶层密室"],
    "climactic_moment": "紫金山之巅的最终决战"
  }
})json";

inline constexpr std::string_view novel_outline_hunks = R"json([
  {
    "oldStart": 12, "oldCount": 4, "newStart": 12, "newCount": 9,
    "lines": [
      {"type": "context", "content": "      \"type\": \"female_lead\","},
      {"type": "context", "content": "      \"description\": \"神秘的药师\""},
      {"type": "deletion", "content": "    }"},
      {"type": "addition", "content": "    },"},
      {"type": "addition", "content": "    {"},
      {"type": "addition", "content": "      \"name\": \"弗利沙沙\","},
      {"type": "addition", "content": "      \"type\": \"final_antagonist\","},
      {"type": "addition", "content": "      \"description\": \"来自外星的征服者\""},
      {"type": "addition", "content": "    }"},
      {"type": "context", "content": "  ],"}
    ]
  },
  {
    "oldStart": 17, "oldCount": 3, "newStart": 22, "newCount": 5,
    "lines": [
      {"type": "context", "content": "    \"core_setting_summary\": \"南京城中隐藏着修仙世界\","},
      {"type": "deletion", "content": "    \"key_locations\": [\"南京眼\", \"紫金山\"]"},
      {"type": "addition", "content": "    \"key_locations\": [\"南京眼\", \"紫金山\"],"},
      {"type": "addition", "content": "    \"key_scenes\": [\"南京眼摩天轮顶层密室\"],"},
      {"type": "addition", "content": "    \"climactic_moment\": \"紫金山之巅的最终决战\""},
      {"type": "context", "content": "  }"}
    ]
  }
])json";

inline constexpr std::string_view novel_outline_patches = R"json([
  {"op": "add", "path": "/characters/2", "value": {"name": "弗利沙沙", "type": "final_antagonist", "description": "来自外星的征服者"}},
  {"op": "add", "path": "/setting/key_scenes", "value": ["南京眼摩天轮顶层密室"]},
  {"op": "add", "path": "/setting/climactic_moment", "value": "紫金山之巅的最终决战"}
])json";

/// The first hunk again, with its header one line too late
inline constexpr std::string_view novel_outline_late_header_diff = R"diff(@@ -13,4 +13,9 @@
       "type": "female_lead",
       "description": "神秘的药师"
-    }
+    },
+    {
+      "name": "弗利沙沙",
+      "type": "final_antagonist",
+      "description": "来自外星的征服者"
+    }
   ],
)diff";

/// Appends a character but forgets the comma in front of it
inline constexpr std::string_view novel_outline_missing_comma_diff = R"diff(@@ -13,3 +13,8 @@
       "description": "神秘的药师"
     }
+    {
+      "name": "弗利沙沙",
+      "type": "final_antagonist",
+      "description": "来自外星的征服者"
+    }
   ],
)diff";

/// Renames the novel and drops the second character
inline constexpr std::string_view novel_outline_rename_diff = R"diff(--- a/document.json
+++ b/document.json
@@ -1,3 +1,3 @@
 {
-  "title": "逆世修仙",
+  "title": "逆世修仙：归来",
   "genre": "都市玄幻",
@@ -8,8 +8,3 @@
       "description": "被逐出家族的少年"
-    },
-    {
-      "name": "苏婉",
-      "type": "female_lead",
-      "description": "神秘的药师"
     }
   ],
)diff";

inline constexpr std::string_view novel_outline_renamed = R"json({
  "title": "逆世修仙：归来",
  "genre": "都市玄幻",
  "characters": [
    {
      "name": "林凡",
      "type": "male_lead",
      "description": "被逐出家族的少年"
    }
  ],
  "setting": {
    "core_setting_summary": "南京城中隐藏着修仙世界",
    "key_locations": ["南京眼", "紫金山"]
  }
})json";

};// namespace fixtures
