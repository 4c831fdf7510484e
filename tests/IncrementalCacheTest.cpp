#include <gtest/gtest.h>
#include <fstream>
#include "Cache/IncrementalCache.h"
#include "Cache/IRSerializer.h"
#include "Common/Hash.h"
#include "IR/IRPrinter.h"
#include "Utils/FileUtils.h"
#include "TestSupport.h"

using namespace FJS;
using FJS::Cache::IncrementalCache;
using FJS::Cache::IRSerializer;

namespace {

const char* kSource = R"(
library shop;
import 'package:flutter/material.dart' as m show Widget, Text;
import 'cart.dart' deferred as cart;
export 'src/api.dart';
part 'shop_part.dart';

enum Status { idle, busy }

typedef Formatter = String Function(double price);

const double taxRate = 0.2;

String describe(List<String> items, {int limit = 3}) {
  final buffer = StringBuffer();
  for (final item in items) {
    if (buffer.length > limit) break;
    buffer.write('$item, ');
  }
  return buffer.toString();
}

class Shop extends StatefulWidget {
  const Shop({super.key, required this.title, this.items = const []});
  final String title;
  final List<String> items;

  @override
  State<Shop> createState() => _ShopState();
}

class _ShopState extends State<Shop> with SingleTickerProviderStateMixin {
  late final AnimationController _fade;
  int _selected = -1;
  Map<String, int> counts = {'a': 1, 'b': 2};

  @override
  void initState() {
    super.initState();
    _fade = AnimationController(vsync: this, duration: const Duration(milliseconds: 300));
  }

  @override
  void dispose() {
    _fade.dispose();
    super.dispose();
  }

  Future<void> refresh() async {
    try {
      await Future.delayed(Duration.zero);
    } catch (e) {
      rethrow;
    } finally {
      _selected = _selected ?? 0;
    }
  }

  @override
  Widget build(BuildContext context) {
    if (widget.items.isEmpty) {
      return const Center(child: Text('Empty'));
    }
    return Scaffold(
      appBar: AppBar(title: Text(widget.title)),
      body: ListView(
        children: [
          for (final item in widget.items)
            ListTile(title: Text(item), onTap: () => setState(() => _selected = 1)),
          if (_selected >= 0) Text('Selected $_selected') else const SizedBox(),
        ],
      ),
    );
  }
}
)";

const char* kPainterSource = R"(
Paint outline(List<double>? widths, Color color) {
  final paint = Paint()..color = color..strokeWidth = widths?[0] ?? 1;
  final pick = <T>(T first, T second) => first;
  paint
    ..style = PaintingStyle.stroke
    ..shader?.dispose();
  return pick(paint, paint);
}
)";

IR::FileDeclaration sampleDeclaration(const std::string& file) {
    return TestSupport::extractSource(kSource, file);
}

void writeRaw(const std::string& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << bytes;
}

} // namespace

TEST(IRSerializerTest, RoundTripsExtractedFile) {
    IR::FileDeclaration original = sampleDeclaration("/p/lib/shop.dart");
    ASSERT_EQ(original.components.size(), 1u);
    ASSERT_EQ(original.stateHolders.size(), 1u);
    ASSERT_FALSE(original.functions.empty());
    ASSERT_FALSE(original.topLevelVariables.empty());

    std::string blob = IRSerializer::serialize(original);
    EXPECT_EQ(blob.substr(0, 4), "FJIR");

    IR::FileDeclaration restored = IRSerializer::deserialize(blob);
    EXPECT_EQ(restored, original);
    EXPECT_EQ(IRSerializer::serialize(restored), blob);
}

TEST(IRSerializerTest, RoundTripsCascadesAndGenericClosures) {
    IR::FileDeclaration original = TestSupport::extractSource(kPainterSource, "/p/lib/painter.dart");
    ASSERT_EQ(original.functions.size(), 1u);

    std::string body = IR::IRPrinter::print(original.functions[0].body);
    EXPECT_NE(body.find("Paint()..color = color..strokeWidth = widths?[0] ?? 1"), std::string::npos) << body;
    EXPECT_NE(body.find("<T>(T first, T second) => first"), std::string::npos) << body;
    EXPECT_NE(body.find("paint..style = PaintingStyle.stroke..shader?.dispose()"), std::string::npos) << body;

    IR::FileDeclaration restored = IRSerializer::deserialize(IRSerializer::serialize(original));
    EXPECT_EQ(restored, original);
    EXPECT_EQ(IR::IRPrinter::print(restored.functions[0].body), body);
}

TEST(IRSerializerTest, RejectsCorruptData) {
    std::string blob = IRSerializer::serialize(sampleDeclaration("/p/lib/shop.dart"));

    EXPECT_THROW(IRSerializer::deserialize(""), Cache::SerializationError);
    EXPECT_THROW(IRSerializer::deserialize("XXXX" + blob.substr(4)), Cache::SerializationError);
    EXPECT_THROW(IRSerializer::deserialize(blob.substr(0, blob.size() / 2)), Cache::SerializationError);
    EXPECT_THROW(IRSerializer::deserialize(blob + "junk"), Cache::SerializationError);

    std::string wrongVersion = blob;
    wrongVersion[4] = static_cast<char>(IRSerializer::kFormatVersion + 1);
    EXPECT_THROW(IRSerializer::deserialize(wrongVersion), Cache::SerializationError);
}

TEST(ContentHashTest, IgnoresWhitespaceOnlyEdits) {
    std::string a = "class A {}\nclass B {}\n";
    std::string b = "\n\nclass A {}   \r\nclass B {}\t\n\n";
    EXPECT_EQ(Common::contentHash(a), Common::contentHash(b));
    EXPECT_NE(Common::contentHash(a), Common::contentHash("class A {}\nclass C {}\n"));
    EXPECT_EQ(Common::contentHash(a).size(), 16u);
}

TEST(IncrementalCacheTest, PersistsAcrossInstances) {
    TestSupport::TempDir dir;
    std::string file = "/p/lib/shop.dart";
    IR::FileDeclaration declaration = sampleDeclaration(file);

    {
        IncrementalCache cache(dir.path() + "/cache");
        ASSERT_TRUE(cache.initialize());
        EXPECT_FALSE(cache.hashOf(file).has_value());
        EXPECT_EQ(cache.getDeclaration(file), nullptr);

        cache.setHash(file, "0123456789abcdef");
        EXPECT_TRUE(cache.saveDeclaration(file, declaration));
        EXPECT_TRUE(cache.saveIndex());
    }

    IncrementalCache reopened(dir.path() + "/cache");
    ASSERT_TRUE(reopened.initialize());
    EXPECT_EQ(reopened.hashOf(file), std::optional<std::string>("0123456789abcdef"));
    EXPECT_TRUE(reopened.hasDeclaration(file));

    auto loaded = reopened.getDeclaration(file);
    ASSERT_NE(loaded, nullptr);
    EXPECT_EQ(*loaded, declaration);
    EXPECT_EQ(reopened.statistics().entries, 1u);
    EXPECT_GT(reopened.statistics().diskBytes, 0u);
}

TEST(IncrementalCacheTest, CorruptBlobIsAMiss) {
    TestSupport::TempDir dir;
    std::string file = "/p/lib/shop.dart";

    IncrementalCache writer(dir.path());
    ASSERT_TRUE(writer.initialize());
    ASSERT_TRUE(writer.saveDeclaration(file, sampleDeclaration(file)));

    writeRaw(writer.blobPath(file), "FJIR garbage");

    IncrementalCache reader(dir.path());
    ASSERT_TRUE(reader.initialize());
    EXPECT_TRUE(reader.hasDeclaration(file));
    EXPECT_EQ(reader.getDeclaration(file), nullptr);
}

TEST(IncrementalCacheTest, BlobOfAnotherFileIsAMiss) {
    TestSupport::TempDir dir;
    IncrementalCache cache(dir.path());
    ASSERT_TRUE(cache.initialize());

    std::string blob = IRSerializer::serialize(sampleDeclaration("/p/lib/other.dart"));
    writeRaw(cache.blobPath("/p/lib/shop.dart"), blob);
    EXPECT_EQ(cache.getDeclaration("/p/lib/shop.dart"), nullptr);
}

TEST(IncrementalCacheTest, IncompatibleIndexStartsFresh) {
    TestSupport::TempDir dir;
    writeRaw(dir.path() + "/index", "FJSIDX 0\nabcdef\t/p/lib/a.dart\n");

    IncrementalCache cache(dir.path());
    ASSERT_TRUE(cache.initialize());
    EXPECT_FALSE(cache.hashOf("/p/lib/a.dart").has_value());
    EXPECT_EQ(cache.statistics().entries, 0u);
}

TEST(IncrementalCacheTest, MemoryLayerIsBounded) {
    TestSupport::TempDir dir;
    IncrementalCache cache(dir.path(), 2);
    ASSERT_TRUE(cache.initialize());

    IR::FileDeclaration a;
    a.file = "/p/lib/a.dart";
    IR::FileDeclaration b;
    b.file = "/p/lib/b.dart";
    IR::FileDeclaration c;
    c.file = "/p/lib/c.dart";

    ASSERT_TRUE(cache.saveDeclaration(a.file, a));
    ASSERT_TRUE(cache.saveDeclaration(b.file, b));
    ASSERT_NE(cache.getDeclaration(a.file), nullptr);
    ASSERT_TRUE(cache.saveDeclaration(c.file, c));
    EXPECT_EQ(cache.statistics().memoryEntries, 2u);

    // Evicted from memory but still on disk
    auto reloaded = cache.getDeclaration(b.file);
    ASSERT_NE(reloaded, nullptr);
    EXPECT_EQ(*reloaded, b);
    EXPECT_EQ(cache.statistics().memoryEntries, 2u);
}

TEST(IncrementalCacheTest, PruneDropsDeletedFiles) {
    TestSupport::TempDir dir;
    IncrementalCache cache(dir.path());
    ASSERT_TRUE(cache.initialize());

    std::map<std::string, IR::FileDeclaration> declarations;
    for (const char* name : {"/p/lib/a.dart", "/p/lib/b.dart", "/p/lib/c.dart"}) {
        IR::FileDeclaration declaration;
        declaration.file = name;
        declarations[name] = declaration;
        cache.setHash(name, "00000000000000aa");
    }
    EXPECT_EQ(cache.saveAll(declarations).size(), 3u);

    EXPECT_EQ(cache.prune({"/p/lib/a.dart", "/p/lib/c.dart"}), 1u);
    EXPECT_FALSE(cache.hashOf("/p/lib/b.dart").has_value());
    EXPECT_FALSE(Utils::FileUtils::fileExists(cache.blobPath("/p/lib/b.dart")));
    EXPECT_TRUE(cache.hasDeclaration("/p/lib/a.dart"));
    EXPECT_EQ(cache.prune({"/p/lib/a.dart", "/p/lib/c.dart"}), 0u);
}

TEST(IncrementalCacheTest, SaveAllReportsOnlyWrittenFiles) {
    TestSupport::TempDir dir;
    IncrementalCache cache(dir.path());
    ASSERT_TRUE(cache.initialize());

    // A directory in the way of the blob makes its rename fail
    std::string blocked = cache.blobPath("/p/lib/b.dart");
    ASSERT_TRUE(Utils::FileUtils::ensureDirectory(blocked));
    ASSERT_TRUE(Utils::FileUtils::writeFileAtomic(Utils::FileUtils::joinPath({blocked, "keep"}), "x"));

    std::map<std::string, IR::FileDeclaration> declarations;
    for (const char* name : {"/p/lib/a.dart", "/p/lib/b.dart", "/p/lib/c.dart"}) {
        IR::FileDeclaration declaration;
        declaration.file = name;
        declarations[name] = declaration;
    }
    EXPECT_EQ(cache.saveAll(declarations), std::vector<std::string>({"/p/lib/a.dart", "/p/lib/c.dart"}));
}

TEST(IncrementalCacheTest, ClearRemovesEverything) {
    TestSupport::TempDir dir;
    IncrementalCache cache(dir.path());
    ASSERT_TRUE(cache.initialize());

    IR::FileDeclaration declaration;
    declaration.file = "/p/lib/a.dart";
    cache.setHash(declaration.file, "00000000000000aa");
    ASSERT_TRUE(cache.saveDeclaration(declaration.file, declaration));
    ASSERT_TRUE(cache.saveIndex());

    cache.clear();
    EXPECT_FALSE(cache.hasDeclaration(declaration.file));
    EXPECT_FALSE(Utils::FileUtils::fileExists(cache.indexPath()));
    auto stats = cache.statistics();
    EXPECT_EQ(stats.entries, 0u);
    EXPECT_EQ(stats.memoryEntries, 0u);
    EXPECT_EQ(stats.diskBytes, 0u);
}
