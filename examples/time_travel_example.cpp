#include <strata/db.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace strata;

namespace {

std::shared_ptr<arrow::Schema> CompanySchema() {
    return arrow::schema({
        arrow::field("company_id", arrow::utf8()),
        arrow::field("company_name", arrow::utf8()),
        arrow::field("global_tickers", arrow::utf8()),   // JSON text
    });
}

arrow::Result<std::shared_ptr<arrow::RecordBatch>> CompanyBatch() {
    arrow::StringBuilder ids, names, tickers;
    ARROW_RETURN_NOT_OK(ids.AppendValues(std::vector<std::string>{"c-001", "c-002", "c-003"}));
    ARROW_RETURN_NOT_OK(names.AppendValues(std::vector<std::string>{"Acme Corp", "Globex", "Initech"}));
    ARROW_RETURN_NOT_OK(tickers.AppendValues(std::vector<std::string>{
        R"({"primary": "ACME", "exchanges": ["NYSE", "LSE"]})",
        R"({"primary": "GBX", "exchanges": ["NASDAQ"]})",
        R"({"primary": "INTC", "exchanges": []})",
    }));
    std::shared_ptr<arrow::Array> id_array, name_array, ticker_array;
    ARROW_RETURN_NOT_OK(ids.Finish(&id_array));
    ARROW_RETURN_NOT_OK(names.Finish(&name_array));
    ARROW_RETURN_NOT_OK(tickers.Finish(&ticker_array));
    return arrow::RecordBatch::Make(CompanySchema(), 3, {id_array, name_array, ticker_array});
}

void PrintTable(const std::string& title, const std::shared_ptr<arrow::Table>& table) {
    std::cout << "\n" << title << " (" << table->num_rows() << " rows)" << std::endl;
    std::cout << table->ToString() << std::endl;
}

bool Check(const Status& status, const std::string& what) {
    if (!status.ok()) {
        std::cerr << what << " failed: " << status.ToString() << std::endl;
        return false;
    }
    return true;
}

}  // namespace

int main() {
    std::cout << "Strata Time Travel Example" << std::endl;
    std::cout << "==========================" << std::endl;

    const std::string path = (std::filesystem::temp_directory_path() / "strata_time_travel_example").string();
    std::filesystem::remove_all(path);

    StoreOptions options;
    options.db_path = path;

    std::unique_ptr<Database> db;
    if (!Check(Database::Open(options, &db), "Open")) return 1;

    Session admin{"ADMIN", kAccountAdminRole};
    const std::string table = "cybersyn.public.company_metadata";

    TableEntry entry;
    if (!Check(db->CreateTable(admin, table, CompanySchema(), TableOptions(), &entry), "CREATE TABLE")) return 1;

    auto batch = CompanyBatch();
    if (!Check(Status::FromArrowStatus(batch.status()), "Build batch")) return 1;

    TableState state;
    if (!Check(db->Insert(admin, table, {*batch}, WriteOptions(), &state), "INSERT")) return 1;

    // Semi-structured projection: global_tickers:primary::string
    std::vector<ProjectionSpec> specs = {
        {"primary_ticker", "global_tickers", "primary", arrow::utf8(), false},
        {"first_exchange", "global_tickers", "exchanges[0]", arrow::utf8(), false},
        {"exchanges", "global_tickers", "exchanges", nullptr, false},
    };
    std::shared_ptr<arrow::Table> result;
    if (!Check(db->Project(admin, table, Locator::Current(), specs, &result), "Project")) return 1;
    PrintTable("Projected tickers", result);

    // Zero-copy clone
    CloneRecord clone;
    if (!Check(db->CloneTable(admin, table, Locator::Current(), "cybersyn.public.company_metadata_dev",
                              TableOptions(), &clone), "CLONE")) return 1;
    std::cout << "\nCloned table " << clone.source_table_id << "@" << clone.source_state_id
              << " into table " << clone.new_table_id << "; segments stored: "
              << db->segments()->Size() << std::endl;

    // DROP / UNDROP
    if (!Check(db->DropTable(admin, table), "DROP")) return 1;
    Status missing = db->Scan(admin, table, Locator::Current(), &result);
    std::cout << "After DROP: " << missing.ToString() << std::endl;
    if (!Check(db->UndropTable(admin, table), "UNDROP")) return 1;
    std::cout << "After UNDROP the table is back" << std::endl;

    // The mistake: UPDATE company_metadata SET company_name = 'oops'
    WriteOptions update_options;
    update_options.statement_ref = "update-oops";
    int64_t affected = 0;
    if (!Check(db->UpdateWhere(admin, table, {{"company_name", std::make_shared<arrow::StringScalar>("oops")}},
                               nullptr, update_options, &state, &affected), "UPDATE")) return 1;
    std::cout << "\nUPDATE touched " << affected << " rows" << std::endl;
    if (!Check(db->Scan(admin, table, Locator::Current(), &result), "SELECT")) return 1;
    PrintTable("After the bad update", result);

    // CREATE OR REPLACE TABLE company_metadata AS SELECT * FROM company_metadata
    //   BEFORE(STATEMENT => 'update-oops')
    if (!Check(db->RestoreTable(admin, table, table, Locator::BeforeStatement("update-oops"),
                                WriteOptions(), &state), "RESTORE")) return 1;
    if (!Check(db->Scan(admin, table, Locator::Current(), &result), "SELECT")) return 1;
    PrintTable("Restored", result);

    std::vector<TableStatePtr> history;
    if (!Check(db->History(admin, table, &history), "History")) return 1;
    std::cout << "History, newest first:" << std::endl;
    for (const auto& s : history) {
        std::cout << "  state " << s->state_id << " " << OperationKindToString(s->operation)
                  << " ref=" << s->statement_ref << " segments=" << s->segments.size() << std::endl;
    }

    // Roles: a junior DBA may read but not drop
    if (!Check(db->CreateRole(admin, "JUNIOR_DBA"), "CREATE ROLE")) return 1;
    if (!Check(db->CreateUser(admin, "junior"), "CREATE USER")) return 1;
    if (!Check(db->GrantRoleToUser(admin, "JUNIOR_DBA", "junior"), "GRANT ROLE")) return 1;
    if (!Check(db->Grant(admin, "JUNIOR_DBA", Privilege::kSelect, ObjectRef::Database("cybersyn")), "GRANT")) {
        return 1;
    }
    Session junior{"junior", "JUNIOR_DBA"};
    std::cout << "\nJunior SELECT: " << db->Scan(junior, table, Locator::Current(), &result).ToString()
              << std::endl;
    std::cout << "Junior DROP: " << db->DropTable(junior, table).ToString() << std::endl;

    db.reset();
    std::filesystem::remove_all(path);
    std::cout << "\nTime travel example completed successfully!" << std::endl;
    return 0;
}
