//===----------------------------------------------------------------------===//
//                     DuckES Query Runner - Unit Tests
//
// tests/unit/connector/test_catalog_registry.cpp
//
// Unit tests for plugin installation, catalog creation and the tpch plugin
//===----------------------------------------------------------------------===//

#include "connector/catalog_registry.hpp"
#include "connector/tpch/tpch_plugin.hpp"
#include "query/query_node.hpp"
#include "logging/logger.hpp"
#include <cassert>
#include <iostream>

using namespace duckes;

//===----------------------------------------------------------------------===//
// Helpers
//===----------------------------------------------------------------------===//

static std::vector<std::string> shutdown_order;

class RecordingConnector : public Connector {
public:
    RecordingConnector(std::string name_p, CatalogProperties properties_p)
        : name(std::move(name_p)), properties(std::move(properties_p)) {}

    const std::string& GetCatalogName() const override { return name; }
    void Attach(QueryNode&) override {}
    bool IsQueryable() const override { return false; }
    void Shutdown() override { shutdown_order.push_back(name); }

    const CatalogProperties& GetProperties() const { return properties; }

private:
    std::string name;
    CatalogProperties properties;
};

class RecordingPlugin : public Plugin {
public:
    std::string GetConnectorName() const override { return "recording"; }

    std::unique_ptr<Connector> CreateConnector(const std::string& catalog_name,
                                               const CatalogProperties& properties) override {
        if (properties.count("reject")) {
            throw ConfigError("rejected by plugin");
        }
        created++;
        return std::make_unique<RecordingConnector>(catalog_name, properties);
    }

    int created = 0;
};

template<typename Fn>
static bool ThrowsConfigError(Fn fn) {
    try {
        fn();
    } catch (const ConfigError&) {
        return true;
    }
    return false;
}

//===----------------------------------------------------------------------===//
// Registry
//===----------------------------------------------------------------------===//

void TestInstallPlugin() {
    std::cout << "  Testing plugin installation..." << std::endl;

    CatalogRegistry registry;
    assert(!registry.HasPlugin("recording"));
    registry.InstallPlugin(std::make_shared<RecordingPlugin>());
    assert(registry.HasPlugin("recording"));

    assert(ThrowsConfigError([&] { registry.InstallPlugin(std::make_shared<RecordingPlugin>()); }));

    std::cout << "    PASSED" << std::endl;
}

void TestCreateCatalog() {
    std::cout << "  Testing catalog creation..." << std::endl;

    CatalogRegistry registry;
    auto plugin = std::make_shared<RecordingPlugin>();
    registry.InstallPlugin(plugin);

    CatalogProperties properties = {{"a", "1"}};
    Connector& connector = registry.CreateCatalog("first", "recording", properties);
    assert(connector.GetCatalogName() == "first");
    assert(plugin->created == 1);

    assert(registry.HasCatalog("first"));
    assert(registry.GetConnector("first") == &connector);
    assert(registry.GetConnector("missing") == nullptr);
    assert(registry.GetConnectorName("first") == "recording");
    assert(registry.GetProperties("first").at("a") == "1");

    auto& typed = registry.GetConnectorAs<RecordingConnector>("first");
    assert(typed.GetProperties().at("a") == "1");
    assert(ThrowsConfigError([&] { registry.GetConnectorAs<TpchConnector>("first"); }));
    assert(ThrowsConfigError([&] { registry.GetConnectorAs<RecordingConnector>("missing"); }));

    std::cout << "    PASSED" << std::endl;
}

void TestCreateCatalogErrors() {
    std::cout << "  Testing catalog creation errors..." << std::endl;

    CatalogRegistry registry;
    auto plugin = std::make_shared<RecordingPlugin>();
    registry.InstallPlugin(plugin);
    registry.CreateCatalog("first", "recording", {});

    // Unknown connector
    assert(ThrowsConfigError([&] { registry.CreateCatalog("second", "nothing", {}); }));
    // Duplicate catalog, plugin is not consulted
    assert(ThrowsConfigError([&] { registry.CreateCatalog("first", "recording", {}); }));
    assert(plugin->created == 1);
    // Plugin rejects the properties
    assert(ThrowsConfigError([&] { registry.CreateCatalog("third", "recording", {{"reject", "yes"}}); }));
    assert(!registry.HasCatalog("third"));

    assert(ThrowsConfigError([&] { registry.GetProperties("third"); }));

    std::cout << "    PASSED" << std::endl;
}

void TestShutdownOrder() {
    std::cout << "  Testing shutdown in reverse creation order..." << std::endl;

    shutdown_order.clear();
    {
        CatalogRegistry registry;
        registry.InstallPlugin(std::make_shared<RecordingPlugin>());
        registry.CreateCatalog("a", "recording", {});
        registry.CreateCatalog("b", "recording", {});
        registry.CreateCatalog("c", "recording", {});

        auto listed = registry.ListCatalogs();
        assert((listed == std::vector<std::string>{"a", "b", "c"}));

        registry.Shutdown();
        assert(registry.ListCatalogs().empty());
    }
    // The destructor does not shut connectors down twice
    assert((shutdown_order == std::vector<std::string>{"c", "b", "a"}));

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// TPC-H plugin
//===----------------------------------------------------------------------===//

void TestTpchTables() {
    std::cout << "  Testing benchmark table list..." << std::endl;

    assert(TpchTables().size() == 8);
    assert(TpchTables().front() == "region");
    assert(IsTpchTable("lineitem"));
    assert(!IsTpchTable("LINEITEM"));
    assert(!IsTpchTable("customers"));

    std::cout << "    PASSED" << std::endl;
}

void TestTpchProperties() {
    std::cout << "  Testing tpch plugin properties..." << std::endl;

    TpchPlugin plugin;
    assert(plugin.GetConnectorName() == "tpch");

    auto tiny = plugin.CreateConnector("tpch", {});
    auto* typed = dynamic_cast<TpchConnector*>(tiny.get());
    assert(typed && typed->GetScaleFactor() == TPCH_TINY_SCALE_FACTOR);
    assert(typed->IsQueryable());

    auto larger = plugin.CreateConnector("tpch", {{"tpch.scale-factor", "0.1"}});
    assert(dynamic_cast<TpchConnector*>(larger.get())->GetScaleFactor() == 0.1);

    assert(ThrowsConfigError([&] { plugin.CreateConnector("tpch", {{"tpch.scale-factor", "zero"}}); }));
    assert(ThrowsConfigError([&] { plugin.CreateConnector("tpch", {{"tpch.scale-factor", "-1"}}); }));
    assert(ThrowsConfigError([&] { plugin.CreateConnector("tpch", {{"tpch.splits", "4"}}); }));

    std::cout << "    PASSED" << std::endl;
}

void TestTpchAttach() {
    std::cout << "  Testing tpch catalog attach..." << std::endl;

    QueryNode node(1, true);
    TpchConnector connector("tpch", TPCH_TINY_SCALE_FACTOR);
    connector.Attach(node);

    auto session = node.CreateSession("tpch", "tiny", true);
    auto result = session->Execute("SELECT count(*) FROM nation");
    assert(result->GetValue(0, 0).GetValue<int64_t>() == 25);

    result = session->Execute("SELECT count(*) FROM region");
    assert(result->GetValue(0, 0).GetValue<int64_t>() == 5);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    Logger::Initialize("", "warn");

    std::cout << "=== CatalogRegistry Unit Tests ===" << std::endl;

    std::cout << "\n1. Registry:" << std::endl;
    TestInstallPlugin();
    TestCreateCatalog();
    TestCreateCatalogErrors();
    TestShutdownOrder();

    std::cout << "\n2. TPC-H Plugin:" << std::endl;
    TestTpchTables();
    TestTpchProperties();
    TestTpchAttach();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    Logger::Shutdown();
    return 0;
}
