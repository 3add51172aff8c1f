#include "redline/Compare.h"
#include "redline/Report.h"
#include "redline/errors.h"
#include "redline/xml-utils.h"
#include <iostream>
#include <fstream>
#include <cstring>

using namespace std;
using namespace pugi;
using namespace redline;

static void usage()
{
    cerr<<"Syntax: redline-compare [-c config.json] [-m rebuild|inplace] [-e atomizer|paragraph] [-a author]\n"
        <<"                       [-r report.json] [-v] <original.xml> <revised.xml>\n\n";
    exit(1);
}

int main(int argc, char* argv[])
{
    CompareOptions options;
    string mode, engine, author, report;
    bool verbose = false;
    int i = 1;
    try {
        while (i<argc && argv[i][0]=='-') {
            string arg = argv[i++];
            if (arg=="-v") {
                verbose = true;
                continue;
            }
            if (i>=argc) {
                usage();
            }
            if (arg=="-c") {
                options = loadCompareOptions(argv[i++]);
            } else if (arg=="-m") {
                mode = argv[i++];
            } else if (arg=="-e") {
                engine = argv[i++];
            } else if (arg=="-a") {
                author = argv[i++];
            } else if (arg=="-r") {
                report = argv[i++];
            } else {
                usage();
            }
        }
        if (argc-i!=2) {
            usage();
        }
        // Command line wins over the configuration file
        if (!mode.empty()) {
            options.reconstructionMode = str_to_mode(mode);
        }
        if (!engine.empty()) {
            options.engine = str_to_engine(engine);
        }
        if (!author.empty()) {
            options.author = author;
        }
        options.verbose = options.verbose || verbose;

        xml_document original, revised;
        loadXML(original, argv[i]);
        loadXML(revised, argv[i+1]);
        CompareResult result = compareDocuments(original, revised, options);
        if (!result.fallbackReason.empty()) {
            string passes;
            for (const ReconstructionAttempt& attempt: result.attempts) {
                passes += " "+attempt.pass;
            }
            ErrorMsg warning(ErrorKind::Reconstruction, ErrorType::SafetyCheckFailed, Severity::Warning,
                "In-place output was replaced by a rebuilt document", "Failed passes:"+passes);
            cerr<<warning.msg()<<endl<<warning.extra<<endl;
        }
        cout<<result.documentXml;
        if (!report.empty()) {
            ofstream os(report);
            if (!os) {
                cerr<<"Error: cannot open "<<report<<" for output\n";
                return 1;
            }
            writeCompareReport(result, os);
        }
    } catch (RedlineException& e) {
        cerr<<e.what()<<endl;
        if (!e.extra.empty()) {
            cerr<<e.extra<<endl;
        }
        return 1;
    }
    return 0;
}
