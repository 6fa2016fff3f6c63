#include "dbase.hpp"
#include "dbase/common/printer.hpp"
#include "dbase/common/string_util.hpp"

#include <cstdio>
#include <cstdlib>

/* USAGE:
dbfcli people.dbf
dbfcli people.dbf NAME,CITY -c trim_character_fields=false -c enable_logging=true
*/

using namespace dbase;

void PrintUsage() {
	printf("Usage: dbfcli [filename.dbf] [column,names|--all] [-c name=value]...\n");
	printf("Options:\n");
	for (idx_t i = 0; i < ReaderConfig::GetOptionCount(); i++) {
		auto option = ReaderConfig::GetOptionByIndex(i);
		printf("  %-25s %-8s %s\n", option->name, option->parameter_type, option->description);
	}
	exit(1);
}

static vector<string> SelectColumns(const DBFReader &reader, const string &selection) {
	vector<string> result;
	if (selection.empty() || selection == "--all") {
		for (auto &field : reader.GetFields()) {
			if (!field.is_deletion_flag) {
				result.push_back(field.name);
			}
		}
		return result;
	}
	for (auto &name : StringUtil::Split(selection, ',')) {
		auto column = name;
		StringUtil::Trim(column);
		if (!reader.GetField(column)) {
			throw InvalidInputException("Column \"%s\" does not exist in this file", column);
		}
		result.push_back(column);
	}
	return result;
}

static void PrintTable(DBFReader &reader, const string &selection) {
	Printer::Print(OutputStream::STREAM_STDOUT, reader.GetHeader().ToString());
	Printer::Print(OutputStream::STREAM_STDOUT, "");
	for (auto &field : reader.GetFields()) {
		if (!field.is_deletion_flag) {
			Printer::Print(OutputStream::STREAM_STDOUT, field.ToString());
		}
	}
	Printer::Print(OutputStream::STREAM_STDOUT, "");

	auto columns = SelectColumns(reader, selection);
	Printer::Print(OutputStream::STREAM_STDOUT, StringUtil::Join(columns, "\t"));
	for (auto &record : reader) {
		vector<string> values;
		for (auto &column : columns) {
			values.push_back(record[column].ToString());
		}
		auto line = StringUtil::Join(values, "\t");
		if (reader.LastRecordDeleted()) {
			line = "*" + line;
		}
		Printer::Print(OutputStream::STREAM_STDOUT, line);
	}
}

int main(int argc, const char **argv) {
	if (argc < 2) {
		PrintUsage();
	}
	string filename;
	string selection;
	ReaderConfig config;
	try {
		for (int i = 1; i < argc; i++) {
			string argument(argv[i]);
			if (argument == "-c") {
				if (i + 1 >= argc) {
					PrintUsage();
				}
				config.SetOptionFromString(argv[++i]);
			} else if (argument == "-h" || argument == "--help") {
				PrintUsage();
			} else if (filename.empty()) {
				filename = argument;
			} else if (selection.empty()) {
				selection = argument;
			} else {
				PrintUsage();
			}
		}
		if (filename.empty()) {
			PrintUsage();
		}

		auto fs = FileSystem::CreateLocal();
		DBFReader reader(*fs, filename, config);
		PrintTable(reader, selection);
		config.GetLogManager().Flush();
	} catch (std::exception &ex) {
		ErrorData error(ex);
		Printer::Print(OutputStream::STREAM_STDERR, error.Message());
		return 1;
	}
	return 0;
}
